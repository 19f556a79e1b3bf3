#include "cli/events.hpp"
#include "cli/opt_parser.hpp"

int main(int argc, char* argv[]) {
    XFSFIX::OptParser parser(argc, argv);

    auto& args = parser.parsed_args;

    switch (parser.action_type) {
        case XFSFIX::ActionType::CREATE_IMAGE:
            return XFSFIX::event_create_image(args.disk_path, args.size_mb);
        case XFSFIX::ActionType::INFLATE_IMAGE:
            return XFSFIX::event_inflate_image(args.disk_path, args.out_disk_path, args.size_gb);
        case XFSFIX::ActionType::DISPLAY_STATS:
            return XFSFIX::event_display_stats(args.disk_path);
        case XFSFIX::ActionType::VERIFY_SEEDS:
            return XFSFIX::event_verify_seeds(args.disk_path);
        case XFSFIX::ActionType::DISPLAY_HELP:
            parser.print_help(stdout);
            return 0;
        case XFSFIX::ActionType::INVALID_PARSING:
        default:
            parser.print_help(stdout);
            return 1;
    }
}
