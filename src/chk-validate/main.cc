#include <chklib/checkpoint/checkpoint_file.hh>
#include <chklib/checkpoint/dispatcher.hh>
#include <chklib/checkpoint/validation_logger.hh>
#include <chklib/file_contents.hh>
#include <chklib/logger.hh>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <unistd.h>

namespace {

constexpr int EXIT_PASSED = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE_ERROR = 2;

bool verbose = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "chk-validate";
    }

    (void)printf("Usage: %s [options] <checkpoint-file> <submission-file>\n", program_name);
    (void)puts(R"==(Validates the submission against the checkpoint and prints the result as JSON.

Exit status: 0 if the submission passed, 1 if it failed, 2 on invalid usage or
a file that cannot be loaded.

Options:
  -h, --help            Display this information
  -q, --quiet           Quiet mode, do not log anything but errors
  -v, --verbose         Log every validation step to stderr)==");
}

/**
 * Parses options passed via arguments
 * @param argc like in main (will be modified to hold the number of non-option
 * parameters)
 * @param argv like in main (holds arguments)
 * @return false if an option was invalid
 */
bool parse_options(int& argc, char** argv) {
    int new_argc = 1;
    bool valid = true;

    for (int i = 1; i < argc; ++i) {

        if (argv[i][0] == '-' and argv[i][1] != '\0') {
            if (0 == strcmp(argv[i], "-h") or 0 == strcmp(argv[i], "--help")) {
                help(argv[0]); // argv[0] is valid (argc > 1)
                _exit(EXIT_PASSED);

            } else if (0 == strcmp(argv[i], "-v") or 0 == strcmp(argv[i], "--verbose")) {
                verbose = true;

            } else if (0 == strcmp(argv[i], "-q") or 0 == strcmp(argv[i], "--quiet")) {
                stdlog.open("/dev/null");
                verbose = false;

            } else { // Unknown
                (void)fprintf(stderr, "Unknown option: '%s'\n", argv[i]);
                valid = false;
            }

        } else {
            argv[new_argc++] = argv[i];
        }
    }

    argc = new_argc;
    argv[argc] = nullptr;
    return valid;
}

} // namespace

int main(int argc, char** argv) {
    stdlog.label(false);
    errlog.label(false);

    if (not parse_options(argc, argv) or argc != 3) {
        help(argv[0]);
        return EXIT_USAGE_ERROR;
    }

    chk::CheckpointConfig config;
    std::string code;
    try {
        config = chk::load_checkpoint_config(argv[1]);
    } catch (const std::exception& e) {
        errlog("\033[1;31mError\033[m: ", argv[1], ": ", e.what());
        return EXIT_USAGE_ERROR;
    }
    try {
        code = get_file_contents(argv[2]);
    } catch (const std::exception& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return EXIT_USAGE_ERROR;
    }

    std::unique_ptr<chk::ValidationLogger> logger;
    if (verbose) {
        logger = std::make_unique<chk::StdlogValidationLogger>(stdlog);
    }
    auto res = chk::dispatch(config, code, logger.get());

    (void)puts(res.to_json().c_str());
    return res.passed ? EXIT_PASSED : EXIT_FAILED;
}
