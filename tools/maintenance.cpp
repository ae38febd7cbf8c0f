#include <manifestspace/manifest/DirectoryManifestIndex.hpp>
#include <manifestspace/repo/ClientOptions.hpp>
#include <manifestspace/repo/Repository.hpp>

#include "cli/MaintenanceCommand.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace MS;

int main(int argc, char** argv) {
#ifdef MS_LOG_DEBUG
    MS::set_thread_name("Main");
    MS::logger().configureFromEnvironment();
#endif

    auto cli = CLI::parseMaintenanceCli(argc, argv);
    if (!cli) {
        return EXIT_FAILURE;
    }
    if (cli->show_help) {
        CLI::printMaintenanceUsage(std::cout);
        return EXIT_SUCCESS;
    }

    if (!cli->repo) {
        if (const char* env_repo = std::getenv("MANIFESTSPACE_REPO"); env_repo && *env_repo) {
            cli->repo = std::filesystem::path(env_repo);
        }
    }
    if (!cli->repo) {
        std::cerr << "manifestspace_maintenance: missing repository directory (--repo or MANIFESTSPACE_REPO)" << std::endl;
        CLI::printMaintenanceUsage(std::cerr);
        return EXIT_FAILURE;
    }

    auto index = Manifest::DirectoryManifestIndex::open(Manifest::DirectoryManifestIndex::Options::fromEnvironment(*cli->repo));
    if (!index) {
        std::cerr << "manifestspace_maintenance: " << describeError(index.error()) << std::endl;
        return EXIT_FAILURE;
    }

    Repository repository{std::shared_ptr<Manifest::ManifestIndex>(std::move(*index)), ClientOptions::fromEnvironment()};
    auto       status = CLI::runMaintenanceCommand(*cli, repository, std::cout, std::cerr);
#ifdef MS_LOG_DEBUG
    MS::logger().flush();
#endif
    return status;
}
