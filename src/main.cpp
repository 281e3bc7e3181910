#include "rowdoc/RowDoc.hpp"
#include "rowdoc/io/JsonRowReader.hpp"
#include "rowdoc/utils/ThreadPool.hpp"
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> <rows.json> [--handles] [--threads N]\n"
              << "  Prints one snapshot JSON per row; with --handles also prints the\n"
              << "  document properties that would be delivered for each row.\n";
}

void printHandle(const rowdoc::builder::Handle& handle) {
    const rowdoc::core::Document& doc = handle.getDocument();
    for (const auto& property : doc.properties()) {
        for (const auto& value : property.second) {
            std::cout << fmt::format("  {}: {}\n", property.first, value);
        }
    }
    if (doc.hasContent()) {
        std::cout << fmt::format("  content: {} ({} bytes)\n",
                                 doc.content()->describe(), doc.content()->size());
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string config_path = argv[1];
    const std::string rows_path = argv[2];
    bool with_handles = false;
    size_t threads = 0;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--handles") {
            with_handles = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            threads = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        rowdoc::config::LoadedConfig loaded = rowdoc::config::ConfigLoader::loadFile(config_path);
        if (!rowdoc::initialize(loaded.logging)) {
            return 2;
        }

        rowdoc::builder::ModeSelection selection = rowdoc::builder::selectDocumentBuilder(loaded.connector);
        std::vector<rowdoc::core::Row> rows = rowdoc::io::JsonRowReader::readFile(rows_path);

        std::unique_ptr<rowdoc::utils::ThreadPool> pool;
        if (threads > 1) {
            pool = std::make_unique<rowdoc::utils::ThreadPool>(threads);
        }
        rowdoc::builder::SnapshotBatch batch(selection.builder, pool.get());
        std::vector<rowdoc::builder::SnapshotResult> results = batch.build(rows);

        for (const auto& result : results) {
            if (!result.ok()) {
                std::cerr << fmt::format("row {}: [{}] {}\n", result.index,
                                         rowdoc::core::toString(result.error.code),
                                         result.error.fullMessage());
                continue;
            }
            std::cout << result.snapshot->toJson() << '\n';
            if (with_handles) {
                try {
                    printHandle(result.snapshot->getDocumentHandle());
                } catch (const rowdoc::core::RowDocException& e) {
                    std::cerr << fmt::format("row {}: {}\n", result.index, e.getDetailedMessage());
                }
            }
        }

        const size_t failures = rowdoc::builder::SnapshotBatch::countFailures(results);
        ROWDOC_LOG_INFO("Processed {} rows, {} failed", results.size(), failures);
        rowdoc::cleanup();
        return failures == 0 ? 0 : 1;
    } catch (const rowdoc::core::RowDocException& e) {
        std::cerr << e.getDetailedMessage() << std::endl;
        rowdoc::cleanup();
        return 2;
    }
}
