#include "./commands.hpp"

#include "../provdb/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

static void printUsage(std::string_view exe) {
	std::cerr
		<< "provdb_tool " PROVDB_VERSION_STR "\n"
		<< "usage: " << exe << " [--config <file.json>] [--path <storage_dir>] <command>\n"
		<< "commands:\n"
		<< "  roots                      list the entries of the root mapping\n"
		<< "  dump <oid>                 print a record\n"
		<< "  keys <index> [min] [max]   list index keys, bounds inclusive\n"
	;
}

int main(int argc, char** argv) {
	// better args
	std::vector<std::string_view> args;
	for (int i = 0; i < argc; i++) {
		args.push_back(argv[i]);
	}

	ProvDB::DatabaseConfig conf;
	std::optional<std::string> path_override;

	size_t pos = 1;
	for (; pos < args.size(); pos++) {
		if (args.at(pos) == "--config") {
			if (pos + 1 >= args.size()) {
				printUsage(args.at(0));
				return 1;
			}
			if (!ProvDB::Tool::loadConfigFile(args.at(++pos), conf)) {
				return 1;
			}
		} else if (args.at(pos) == "--path") {
			if (pos + 1 >= args.size()) {
				printUsage(args.at(0));
				return 1;
			}
			path_override = std::string{args.at(++pos)};
		} else {
			break;
		}
	}

	if (path_override.has_value()) {
		conf.storage_path = *path_override;
	}

	if (pos >= args.size()) {
		printUsage(args.at(0));
		return 1;
	}

	const std::string_view command = args.at(pos);
	const std::vector<std::string_view> params(args.cbegin() + pos + 1, args.cend());

	ProvDB::backend::FilesystemStorage storage{conf.storage_path};
	const ProvDB::TypeRegistry types{conf.allowed_namespaces};

	try {
		if (command == "roots" && params.empty()) {
			return ProvDB::Tool::cmdRoots(storage, std::cout);
		} else if (command == "dump" && params.size() == 1) {
			return ProvDB::Tool::cmdDump(storage, types, params.at(0), std::cout);
		} else if (command == "keys" && !params.empty() && params.size() <= 3) {
			std::optional<std::string> min;
			std::optional<std::string> max;
			if (params.size() >= 2) {
				min = std::string{params.at(1)};
			}
			if (params.size() == 3) {
				max = std::string{params.at(2)};
			}
			return ProvDB::Tool::cmdKeys(storage, params.at(0), min, max, std::cout);
		}
	} catch (const ProvDB::NotFound& e) {
		std::cerr << "TL error: " << e.what() << "\n";
		return 2;
	} catch (const ProvDB::Error& e) {
		std::cerr << "TL error: " << e.what() << "\n";
		return 1;
	} catch (const nlohmann::json::exception& e) {
		std::cerr << "TL error: unexpected record layout: " << e.what() << "\n";
		return 1;
	}

	printUsage(args.at(0));
	return 1;
}
