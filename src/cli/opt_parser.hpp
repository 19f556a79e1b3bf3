#ifndef CLI_OPT_PARSER_HPP
#define CLI_OPT_PARSER_HPP
#include <stdint.h>
#include <stdio.h>

namespace XFSFIX {
constexpr int64_t default_size_mb = 50;
constexpr int64_t default_size_gb = 150;

enum class ActionType {
    INVALID_PARSING,
    DISPLAY_HELP,
    CREATE_IMAGE,
    INFLATE_IMAGE,
    DISPLAY_STATS,
    VERIFY_SEEDS,
};

class OptParser {
   private:
    void set_action(ActionType action, char* path);
    void validate();

   public:
    OptParser() = default;
    OptParser(int argc, char* const* argv);

    void parse(int argc, char* const* argv);
    void print_help(FILE* buff);

    ActionType action_type = ActionType::INVALID_PARSING;
    struct {
        char* disk_path = nullptr;
        char* out_disk_path = nullptr;
        int64_t size_mb = default_size_mb;
        int64_t size_gb = default_size_gb;
    } parsed_args;
};
}
#endif
