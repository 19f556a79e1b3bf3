#ifndef CLI_EVENTS_HPP
#define CLI_EVENTS_HPP
#include <stdint.h>

namespace XFSFIX {
int event_create_image(const char* disk_path, int64_t size_mb);
int event_inflate_image(const char* disk_path, const char* out_disk_path, int64_t size_gb);
int event_display_stats(const char* disk_path);
int event_verify_seeds(const char* disk_path);
}
#endif
