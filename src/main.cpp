/*
 * main.cpp - tagsmith-info, prints and edits the ID3 tags of files
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"
#include <getopt.h>

using namespace TagSmith;

static const char _about_message[] = "This is tagsmith-info version " TAGSMITH_VERSION ".\n"
            "\n"
            "Copyright © 2025 The TagSmith Authors\n"
            "\n"
            "TagSmith is free software. You may redistribute and/or modify it under\n"
            "the terms of the ISC License <https://opensource.org/licenses/ISC>\n";

static void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] FILE...\n"
              << "\n"
              << "  --debug=CH1,CH2      enable log channels (id3, id3v1, compression, io, all)\n"
              << "  --logfile=PATH       write log output to PATH instead of stdout\n"
              << "  --set=FRAME=VALUE    set a text frame, may be repeated\n"
              << "  --save=3|4           rewrite the tag as ID3v2.3 or ID3v2.4\n"
              << "  --delete             strip ID3v2 and ID3v1 tags\n"
              << "  --version            print version information\n"
              << "  --help               print this help\n";
}

struct InfoOptions {
    std::vector<std::string> debug_channels;
    std::string logfile;
    std::vector<std::pair<std::string, std::string>> assignments;
    std::optional<uint8_t> save_version;
    bool remove = false;
    std::vector<std::string> files;
};

static void printTags(const std::string& path, Tag::LoadResult& result) {
    std::cout << path << ":\n";
    if (result.header) {
        std::cout << "  ID3v2." << static_cast<int>(result.header->major) << "."
                  << static_cast<int>(result.header->revision) << ", "
                  << result.header->fullSize() << " bytes\n";
    } else {
        std::cout << "  no ID3v2 tag\n";
    }

    result.tags.decodeAll();
    std::istringstream lines(result.tags.pprint());
    std::string line;
    while (std::getline(lines, line)) {
        std::cout << "  " << line << "\n";
    }
    if (!result.tags.unknownFrames().empty()) {
        std::cout << "  (" << result.tags.unknownFrames().size() << " uninterpreted frames)\n";
    }
}

static void processFile(const std::string& path, const InfoOptions& options) {
    if (options.remove) {
        Tag::ID3File::remove(path);
        std::cout << path << ": tags removed\n";
        return;
    }

    Tag::LoadResult result = Tag::ID3File::load(path);

    if (!options.assignments.empty() || options.save_version) {
        // Pending frames render verbatim; decode so text follows the target version
        result.tags.decodeAll();
        for (const auto& assignment : options.assignments) {
            result.tags.setText(assignment.first, {assignment.second});
        }

        Tag::ID3WriteOptions write_options;
        if (options.save_version) {
            write_options.version = *options.save_version;
        } else if (result.header && result.header->major == 3) {
            write_options.version = 3;
        }
        Tag::ID3File::save(path, result.tags, write_options);
        result = Tag::ID3File::load(path);
    }

    printTags(path, result);
}

int main(int argc, char *argv[]) {
    InfoOptions options;

    static const struct option long_options[] = {
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"set", required_argument, 0, 's'},
        {"save", required_argument, 0, 'w'},
        {"delete", no_argument, 0, 'x'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "d:l:s:w:xvh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                options.debug_channels = Debug::parseChannelList(optarg);
                break;
            case 'l':
                options.logfile = optarg;
                break;
            case 's': {
                std::string arg = optarg;
                size_t eq = arg.find('=');
                if (eq != 4 || !Tag::isValidFrameId(reinterpret_cast<const uint8_t*>(arg.data()), 4) ||
                    arg[0] != 'T' || arg.compare(0, 4, "TXXX") == 0) {
                    std::cerr << argv[0] << ": --set expects a text frame as FRAME=value, got '"
                              << arg << "'" << std::endl;
                    return 1;
                }
                options.assignments.emplace_back(arg.substr(0, 4), arg.substr(5));
                break;
            }
            case 'w':
                if (strcmp(optarg, "3") == 0) options.save_version = 3;
                else if (strcmp(optarg, "4") == 0) options.save_version = 4;
                else {
                    std::cerr << argv[0] << ": --save expects 3 or 4" << std::endl;
                    return 1;
                }
                break;
            case 'x':
                options.remove = true;
                break;
            case 'v':
                std::cout << _about_message << std::endl;
                return 0;
            case 'h':
                usage(argv[0]);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.files.push_back(argv[i]);
    }
    if (options.files.empty()) {
        usage(argv[0]);
        return 1;
    }

    Debug::init(options.logfile, options.debug_channels);

    int status = 0;
    for (const auto& path : options.files) {
        try {
            processFile(path, options);
        } catch (const Core::IOException& e) {
            std::cerr << path << ": " << e.what() << std::endl;
            status = 1;
        } catch (const Core::ID3Exception& e) {
            std::cerr << path << ": " << e.what() << std::endl;
            status = 1;
        }
    }

    Debug::shutdown();
    return status;
}
