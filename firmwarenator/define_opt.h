/**
 * This file is included from different places with different
 * definitions of DEFINE_OPT, which should be a macro that takes
 * three arguments:
 *
 *      @name    option name (C identifier, also the shell variable)
 *      @type    data type (String)
 *      @defval  built-in default value
 *
 * Every compressor profile is described by three variables,
 * <NAME>_COMP, <NAME>_COMP_ARGS and <NAME>_DECOMP.
 */

DEFINE_OPT(DEFAULT_COMPRESSOR, String, "zstd")
DEFINE_OPT(ZSTD_COMP, String, "zstd")
DEFINE_OPT(ZSTD_COMP_ARGS, String, "-q -15 -T0")
DEFINE_OPT(ZSTD_DECOMP, String, "unzstd")
DEFINE_OPT(XZ_COMP, String, "xz")
DEFINE_OPT(XZ_COMP_ARGS, String, "--check=crc32 --lzma2=dict=1MiB")
DEFINE_OPT(XZ_DECOMP, String, "unxz")
DEFINE_OPT(LZMA_COMP, String, "lzma")
DEFINE_OPT(LZMA_COMP_ARGS, String, "-9")
DEFINE_OPT(LZMA_DECOMP, String, "unlzma")
DEFINE_OPT(GZIP_COMP, String, "gzip")
DEFINE_OPT(GZIP_COMP_ARGS, String, "-n -9")
DEFINE_OPT(GZIP_DECOMP, String, "gunzip")
DEFINE_OPT(BZIP2_COMP, String, "bzip2")
DEFINE_OPT(BZIP2_COMP_ARGS, String, "-9")
DEFINE_OPT(BZIP2_DECOMP, String, "bunzip2")
DEFINE_OPT(LZ4_COMP, String, "lz4")
DEFINE_OPT(LZ4_COMP_ARGS, String, "-l -9")
DEFINE_OPT(LZ4_DECOMP, String, "unlz4")
DEFINE_OPT(LZOP_COMP, String, "lzop")
DEFINE_OPT(LZOP_COMP_ARGS, String, "-9")
DEFINE_OPT(LZOP_DECOMP, String, "lzop -d")
