#include "metadata_dump.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <thread>

#include <glog/logging.h>

#include "common/configuration.h"
#include "dependency/dependency_resolver.h"
#include "dependency/topological_sequencer.h"
#include "metadata_emitter.h"

namespace Metadump {

namespace {

constexpr Section kSections[kNumSections] = {Section::kGlobal, Section::kPredata, Section::kPostdata};

// Removes section files that were already renamed into place by a run that then failed.
void RemoveCommitted(const std::vector<std::unique_ptr<ByteCountingWriter>>& writers) {
    for (const auto& writer : writers) {
        if (!writer->committed()) continue;
        if (::unlink(writer->path().c_str()) != 0 && errno != ENOENT) {
            LOG(WARNING) << "Failed to remove " << writer->path() << ": " << std::strerror(errno);
        }
    }
}

} // namespace

MetadataDump::Options MetadataDump::OptionsFromConfiguration(const Configuration& config) {
    Options options;
    for (Section section : kSections) {
        options.section_paths[static_cast<int>(section)] = config.getSectionPath(section);
    }
    options.toc_path = config.getTocPath();
    options.parallel_sections = config.getParallelSections();
    options.writer_options.sync_on_commit = config.config().dump.sync_on_commit.get();
    return options;
}

MetadataDump::Result MetadataDump::Run(const std::vector<CatalogObjectRecord>& records) {
    toc_ = std::make_unique<TableOfContents>();
    Result result;

    DependencyResolver resolver;
    DependencyGraph graph = resolver.Resolve(records);
    LOG(INFO) << "Dependency graph has " << graph.size() << " objects and " << graph.num_edges() << " edges ("
              << resolver.stats().excluded_implicit_types << " implicit types excluded, "
              << resolver.stats().external_references << " external references dropped)";

    TopologicalSequencer sequencer;
    const EmissionSequence sequence = sequencer.Sequence(graph);
    result.sequenced_objects = sequence.size();
    result.shells = sequencer.promoted().size();
    if (!sequencer.promoted().empty()) {
        LOG(INFO) << "Promoted " << sequencer.promoted().size() << " types to shells to break dependency cycles";
    }

    std::vector<std::unique_ptr<ByteCountingWriter>> writers;
    for (Section section : kSections) {
        writers.push_back(std::make_unique<ByteCountingWriter>(
                section, options_.section_paths[static_cast<int>(section)], options_.writer_options));
    }

    std::array<std::exception_ptr, kNumSections> errors;
    auto emit = [&](int index) {
        try {
            MetadataEmitter emitter(renderer_, *toc_);
            result.section_entries[index] = emitter.EmitSection(sequence, *writers[index]);
            result.section_bytes[index] = writers[index]->CurrentOffset();
        } catch (const std::exception& e) {
            LOG(ERROR) << "Emitting " << SectionName(kSections[index]) << " section failed: " << e.what();
            errors[index] = std::current_exception();
        }
    };

    if (options_.parallel_sections) {
        std::vector<std::thread> section_threads;
        for (int i = 0; i < kNumSections; ++i) {
            section_threads.emplace_back(emit, i);
        }
        for (auto& t : section_threads) {
            t.join();
        }
    } else {
        for (int i = 0; i < kNumSections; ++i) {
            emit(i);
            if (errors[i]) break;
        }
    }

    for (const auto& error : errors) {
        if (error) {
            for (auto& writer : writers) {
                writer->Abandon();
            }
            std::rethrow_exception(error);
        }
    }

    try {
        for (auto& writer : writers) {
            writer->Commit();
        }
        toc_->WriteToFile(options_.toc_path, options_.writer_options.sync_on_commit);
    } catch (const MetadumpError&) {
        for (auto& writer : writers) {
            writer->Abandon();
        }
        if (!options_.writer_options.direct) {
            RemoveCommitted(writers);
        }
        throw;
    }

    LOG(INFO) << "Dump complete: " << toc_->size() << " TOC entries for " << result.sequenced_objects
              << " sequenced objects";
    return result;
}

} // namespace Metadump
