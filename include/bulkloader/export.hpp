#ifndef BULKLOADER_EXPORT_HPP
#define BULKLOADER_EXPORT_HPP

// clang-format off
#ifdef BULKLOADER_STATIC
// As a static library: no symbol import/export.
#  define BULKLOADER_API
#else
// As a shared library: export symbols on build, import symbols on use.
#  ifdef BULKLOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define BULKLOADER_API __declspec(dllexport)
#    else
#         define BULKLOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define BULKLOADER_API __declspec(dllimport)
#    else
#         define BULKLOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif
// clang-format on

#endif
