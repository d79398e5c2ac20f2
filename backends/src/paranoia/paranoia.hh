#pragma once

#include <cdda/sdk/compiler.hh>

#if defined(CDDA_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wpedantic"
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(CDDA_COMPILER_WASM)
# pragma clang diagnostic push
#endif

#include <cdio/paranoia/cdda.h>
#include <cdio/paranoia/paranoia.h>

#if defined(CDDA_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(CDDA_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(CDDA_COMPILER_CLANG)
# pragma clang diagnostic pop
#elif defined(CDDA_COMPILER_WASM)
# pragma clang diagnostic pop
#endif
