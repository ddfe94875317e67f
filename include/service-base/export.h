#ifndef SERVICE_BASE_EXPORT_H
#define SERVICE_BASE_EXPORT_H

#ifdef _WIN32
#ifdef service_base_core_EXPORTS
#define SERVICE_BASE_API __declspec(dllexport)
#else
#define SERVICE_BASE_API __declspec(dllimport)
#endif
#else
#define SERVICE_BASE_API
#endif

#endif // SERVICE_BASE_EXPORT_H
