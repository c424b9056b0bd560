#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>
#include <memory>

#include "sheetdrop/config/ConfigLoader.hpp"
#include "sheetdrop/server/wserver.hpp"
#include "sheetdrop/server/routes.hpp"
#include "sheetdrop/server/FileStorage.hpp"
#include "sheetdrop/server/AnalyzerRunner.hpp"
#include "sheetdrop/server/HistoryIndex.hpp"
#include "sheetdrop/server/UploadHandler.hpp"
#include "sheetdrop/server/StaticFileHandler.hpp"

using namespace sheetdrop;

void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        std::cout << "\nSignal " << signum << " received, shutting down" << std::endl;
        std::exit(0);
    }
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        ServerConfig config = ConfigLoader::load(argc, argv);

        FileStorage storage(config.storageRoot);
        AnalyzerRunner analyzer(config.analyzerCommand, config.analyzerTimeout);
        HistoryIndex history(storage);
        UploadHandler uploadHandler(storage, analyzer, history);
        StaticFileHandler files(storage);

        std::cout << "Storage root: " << storage.root().string() << std::endl;
        std::cout << "Analyzer:";
        for (const auto& arg : analyzer.command()) std::cout << " " << arg;
        std::cout << " <file>" << std::endl;

        auto server = std::make_shared<wServer>();
        server->set_limits(config.maxHeaderBytes, config.maxBodyBytes);
        register_routes(*server, uploadHandler, history, files);

        server->run(config.port);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
