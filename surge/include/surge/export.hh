// surge

#pragma once

// SG_EXPORT is set while building surge as a shared library and SG_SHARED
// when linking against one; static builds need neither.
#if defined(_WIN32)
#define SG_EXPORT_ATTR __declspec(dllexport)
#define SG_IMPORT_ATTR __declspec(dllimport)
#else
#define SG_EXPORT_ATTR [[gnu::visibility("default")]]
#define SG_IMPORT_ATTR
#endif

#if defined(SG_EXPORT)
#define SG_API SG_EXPORT_ATTR
#elif defined(SG_SHARED)
#define SG_API SG_IMPORT_ATTR
#else
#define SG_API
#endif
