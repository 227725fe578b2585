#include <cstdio>
#include <cstdlib>
#include <string>
#include "kb_sender.h"
#include "logging.h"

int main(int argc, char** argv) {
    kb_sender::Options opts;
    std::string error;

    if (!kb_sender::default_options(opts, error, [](const char* name) { return getenv(name); }) ||
        !kb_sender::parse_args(argc, argv, opts, error)) {
        fprintf(stderr, "ERROR: %s\n%s", error.c_str(), kb_sender::usage(argv[0]).c_str());
        return kb_sender::EXIT_USAGE;
    }
    if (opts.show_help) {
        fputs(kb_sender::usage(argv[0]).c_str(), stdout);
        return kb_sender::EXIT_SENT;
    }
    logging::set_verbose(opts.debug);

    std::string payload;
    if (!kb_sender::load_payload(opts, payload, error)) {
        fprintf(stderr, "ERROR: %s\n", error.c_str());
        return kb_sender::EXIT_USAGE;
    }
    return kb_sender::send(opts, payload);
}
