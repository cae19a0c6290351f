#include <spdlog/spdlog.h>

#include <qms/cli/qms_cli.h>

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    qms::cli::QmsCLI cli;
    return cli.run(argc, argv);
}
