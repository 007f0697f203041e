/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief VRB version and export macros
 */

#pragma once

/** \brief VRB major version */
#define VRB_VERSION_MAJOR 0
/** \brief VRB minor version */
#define VRB_VERSION_MINOR 3
/** \brief VRB bugfix version */
#define VRB_VERSION_PATCH 0

/** \cond DO_NOT_DOCUMENT */
#ifdef __cplusplus
# define VRB_EXTERN_C extern "C"
#else
# define VRB_EXTERN_C
#endif

#if defined(_WIN32) && !defined(VRB_STATIC)
# if defined(VRB_BUILD)
#  define VRB_EXPORT __declspec(dllexport)
# else
#  define VRB_EXPORT __declspec(dllimport)
# endif
#elif defined(__GNUC__) && !defined(VRB_STATIC)
# define VRB_EXPORT __attribute__((visibility("default")))
#else
# define VRB_EXPORT
#endif

#define VRB_API VRB_EXTERN_C VRB_EXPORT

#if defined(_WIN32) && !defined(_WIN64)
# define VRB_CALL __cdecl
#else
# define VRB_CALL
#endif

#define VRB_ENUM(name) \
    typedef VrbInt32 name; \
    enum

#define VRB_STRUCT_SIZE(type, field) \
    (offsetof(type, field) + sizeof(((type *)NULL)->field))
/** \endcond */
