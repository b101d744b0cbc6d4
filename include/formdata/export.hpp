#ifndef FORMDATA_EXPORT_HPP
#define FORMDATA_EXPORT_HPP


#ifdef FORMDATA_STATIC
// As a static library: no symbol import/export.
#  define FORMDATA_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef FORMDATA_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define FORMDATA_API __declspec(dllexport)
#    else
#         define FORMDATA_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define FORMDATA_API __declspec(dllimport)
#    else
#         define FORMDATA_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
