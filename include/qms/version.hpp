/*
 * Fallback version header for qmsearch
 *
 * The build system passes the real version through compile definitions;
 * these defaults keep the code compiling when it does not.
 */

#pragma once

#ifndef QMS_VERSION_MAJOR
#define QMS_VERSION_MAJOR 0
#endif

#ifndef QMS_VERSION_MINOR
#define QMS_VERSION_MINOR 0
#endif

#ifndef QMS_VERSION_PATCH
#define QMS_VERSION_PATCH 0
#endif

#ifndef QMS_VERSION_STRING
#define QMS_VERSION_STRING "0.0.0+dev"
#endif
