#include "opt_parser.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>

#include "xfsfix/data_structs.hpp"
namespace XFSFIX {
namespace {
/* Accepts 1..max_value so that value * unit stays inside int64_t. */
int64_t parse_size(const char* arg, int64_t max_value) {
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(arg, &end, 10);
    if (errno != 0 || end == arg || *end != '\0' || value <= 0 || value > max_value) {
        return -1;
    }
    return value;
}
}

OptParser::OptParser(int argc, char* const* argv) { parse(argc, argv); }

void OptParser::set_action(ActionType action, char* path) {
    if (action_type == ActionType::INVALID_PARSING) {
        action_type = action;
        parsed_args.disk_path = path;
    }
}

void OptParser::parse(int argc, char* const* argv) {
    int opt;
    bool parse_error = false;

    // Restart getopt so parse() can run more than once in a process.
    optind = 0;
    while ((opt = getopt(argc, argv, "hc:e:x:v:o:s:g:")) != -1) {
        switch (opt) {
            case 'h':
                if (action_type == ActionType::INVALID_PARSING) {
                    action_type = ActionType::DISPLAY_HELP;
                }
                break;
            case 'c':
                set_action(ActionType::CREATE_IMAGE, optarg);
                break;
            case 'e':
                set_action(ActionType::INFLATE_IMAGE, optarg);
                break;
            case 'x':
                set_action(ActionType::DISPLAY_STATS, optarg);
                break;
            case 'v':
                set_action(ActionType::VERIFY_SEEDS, optarg);
                break;
            case 'o':
                parsed_args.out_disk_path = optarg;
                break;
            case 's':
                parsed_args.size_mb = parse_size(optarg, max_size_mb);
                parse_error |= parsed_args.size_mb == -1;
                break;
            case 'g':
                parsed_args.size_gb = parse_size(optarg, max_size_gb);
                parse_error |= parsed_args.size_gb == -1;
                break;

            default: /* '?' */
                parse_error = true;
        }
    }

    if (parse_error) {
        action_type = ActionType::INVALID_PARSING;
        return;
    }
    validate();
}

void OptParser::validate() {
    switch (action_type) {
        case ActionType::INFLATE_IMAGE:
            if (parsed_args.out_disk_path == nullptr) {
                action_type = ActionType::INVALID_PARSING;
            }
            break;
        default:
            break;
    }
}

void OptParser::print_help(FILE* buff) {
    char help[] =
        "XFS Fixture Image Generator\n"
        "==============================\n"
        "Builds small images carrying an XFS superblock and seeded file remnants, and rewrites "
        "their superblock so the filesystem claims a larger size than the file occupies.\n"
        "Usage: xfsfix <option> <args>\n"
        "Options:\n"
        "\t-h : Displays this panel.\n"
        "\t-c <image_path> : Creates new image.\n"
        "\t\t Optional: -s <size> : Image size in MB (50).\n"
        "\t-e <image_path> -o <out_image_path> : Writes a copy of the image reporting a larger size.\n"
        "\t\t Optional: -g <size> : Reported size in GB (150).\n"
        "\t-x <image_path> : Displays superblock of the image.\n"
        "\t-v <image_path> : Checks that every seed block is present in the image.\n"
        "\n"
        "Args:\n"
        "\t-s : Image size in MB.\n"
        "\t-g : Reported filesystem size in GB.\n"
        "\t-o : Output image path.\n";

    fprintf(buff, "%s", help);
}
}
