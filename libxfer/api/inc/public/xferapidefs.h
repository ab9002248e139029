#ifndef XFER_API_XFERAPIDEFS_H_
#define XFER_API_XFERAPIDEFS_H_

#if defined(__GNUC__)
#define XFER_API_EXPORT __attribute__((visibility("default")))
#define XFER_API_IMPORT
#else  // Unsupported compiler
#define XFER_API_EXPORT
#define XFER_API_IMPORT
#endif  // defined(__GNUC__)

#ifdef XFER_BUILD_SHARED_LIB
#define XFER_API XFER_API_EXPORT
#else
#define XFER_API XFER_API_IMPORT
#endif  // XFER_BUILD_SHARED_LIB

#endif  // XFER_API_XFERAPIDEFS_H_
