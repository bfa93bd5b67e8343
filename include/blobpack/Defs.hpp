#ifndef _BLOBPACK_API_DEFS_H
#define _BLOBPACK_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef BLOBPACK_API_EXPORTS
#    define BLOBPACK_API_DECL __declspec (dllexport)
#  else
#    define BLOBPACK_API_DECL __declspec (dllimport)
#  endif
#else
#  define BLOBPACK_API_DECL __attribute__((visibility("default")))
#endif

#endif
