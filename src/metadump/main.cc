#include <sys/stat.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "catalog/catalog_loader.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "emitter/metadata_dump.h"
#include "render/ddl_renderer.h"

namespace {

// Creates dir and its missing parents.
bool MakeDirectories(const std::string& dir) {
	if (dir.empty()) return true;
	std::string partial;
	size_t pos = 0;
	while (pos != std::string::npos) {
		pos = dir.find('/', pos + 1);
		partial = dir.substr(0, pos);
		if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
			LOG(ERROR) << "Cannot create directory " << partial << ": " << strerror(errno);
			return false;
		}
	}
	return true;
}

int RunDump(const cxxopts::Options& options, const cxxopts::ParseResult& arguments) {
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}
	if (!arguments.count("catalog")) {
		LOG(ERROR) << "--catalog is required\n" << options.help();
		return EXIT_FAILURE;
	}

	// *************** Configuration **********************
	Metadump::Configuration& config = Metadump::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string config_file = arguments["config"].as<std::string>();
		if (!config.loadFromFile(config_file)) {
			LOG(ERROR) << "Invalid configuration " << config_file;
			for (const auto& error : config.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
	}
	if (arguments.count("output_dir")) {
		config.config().output.directory.set(arguments["output_dir"].as<std::string>());
	}
	if (arguments.count("serial")) {
		config.config().dump.parallel_sections.set(false);
	}
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	FLAGS_v = arguments.count("log_level") ? arguments["log_level"].as<int>()
	                                       : config.config().logging.verbosity.get();
	const std::string log_dir = config.config().logging.directory.get();
	if (!log_dir.empty()) {
		if (!MakeDirectories(log_dir)) {
			return EXIT_FAILURE;
		}
		FLAGS_log_dir = log_dir;
		FLAGS_logtostderr = 0;
		FLAGS_alsologtostderr = 1;
	}

	// *************** Dump **********************
	try {
		Metadump::CatalogSnapshot snapshot =
				Metadump::CatalogLoader::LoadFromFile(arguments["catalog"].as<std::string>());
		if (arguments.count("source_version")) {
			snapshot.version = arguments["source_version"].as<std::string>();
		}

		if (!MakeDirectories(config.config().output.directory.get())) {
			return EXIT_FAILURE;
		}

		Metadump::DdlRenderer renderer(snapshot.version);
		Metadump::MetadataDump dump(Metadump::MetadataDump::OptionsFromConfiguration(config), renderer);
		Metadump::MetadataDump::Result result = dump.Run(snapshot.records);
		LOG(INFO) << "Dumped " << result.sequenced_objects << " objects (" << result.shells << " shell types) to "
		          << config.config().output.directory.get();
	} catch (const Metadump::MetadumpError& e) {
		LOG(ERROR) << "Metadata dump failed: " << e.what();
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1;

	cxxopts::Options options("metadump", "Dumps database metadata as dependency-ordered DDL with a byte-indexed TOC");

	options.add_options()
		("catalog", "Catalog snapshot (YAML) to dump", cxxopts::value<std::string>())
		("config", "Configuration file (YAML)", cxxopts::value<std::string>())
		("o,output_dir", "Directory for section files and the TOC", cxxopts::value<std::string>())
		("source_version", "Override the source version recorded in the snapshot", cxxopts::value<std::string>())
		("serial", "Emit sections one after another instead of concurrently")
		("l,log_level", "Log level", cxxopts::value<int>())
		("h,help", "Print usage");

	try {
		return RunDump(options, options.parse(argc, argv));
	} catch (const cxxopts::exceptions::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what() << "\n" << options.help();
		return EXIT_FAILURE;
	}
}
