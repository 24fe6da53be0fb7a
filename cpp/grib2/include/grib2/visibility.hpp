/** Defines a GRIB2_PUBLIC visibility attribute macro, used on all public interfaces.
 *  Define it before including `grib2.hpp` to control symbol visibility directly.
 *  Otherwise symbols are exported from the translation unit that defines
 *  GRIB2_IMPLEMENTATION and imported everywhere else.
 */
#ifndef GRIB2_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef __GNUC__
#      define GRIB2_EXPORT __attribute__((dllexport))
#      define GRIB2_IMPORT __attribute__((dllimport))
#    else
#      define GRIB2_EXPORT __declspec(dllexport)
#      define GRIB2_IMPORT __declspec(dllimport)
#    endif
#    ifdef GRIB2_IMPLEMENTATION
#      define GRIB2_PUBLIC GRIB2_EXPORT
#    else
#      define GRIB2_PUBLIC GRIB2_IMPORT
#    endif
#  else
#    define GRIB2_EXPORT __attribute__((visibility("default")))
#    define GRIB2_IMPORT
#    if __GNUC__ >= 4
#      define GRIB2_PUBLIC __attribute__((visibility("default")))
#    else
#      define GRIB2_PUBLIC
#    endif
#  endif
#endif
