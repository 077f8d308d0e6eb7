/**
 * @file nodefs_cli.cpp
 * @brief Command-line access to nodefs filesystems
 *
 * Every path argument is an address: "@name/path" for a filesystem from the
 * config, a URL, or a local path.
 *
 * Usage:
 *   nodefs -c fs.yaml ls @archive/data
 *   nodefs -c fs.yaml cp @archive/data/run.bin ./run.bin
 *   nodefs hash --algorithm sha256 /etc/hostname
 */

#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "nodefs/nodefs.hpp"

namespace po = boost::program_options;
using namespace nodefs;

namespace {

std::string kind_of(const NodePtr& node) {
    Readable* readable = node->as<Readable>();
    if (!readable) {
        return "?";
    }
    if (readable->is_link()) return "l";
    if (readable->is_folder()) return "d";
    if (readable->is_file()) return "-";
    return "?";
}

std::string display_name(const NodePtr& node) {
    std::string name = node->path().name();
    Readable* readable = node->as<Readable>();
    if (readable) {
        auto target = readable->link_target();
        if (target) {
            name += " -> " + *target;
        }
    }
    return name;
}

int cmd_ls(const Registry& registry, const std::vector<std::string>& args, bool long_format) {
    for (const auto& address : args) {
        NodePtr node = registry.resolve(address);
        if (args.size() > 1) {
            std::cout << address << ":" << std::endl;
        }
        for (const auto& child : node->require<Listable>().children()) {
            if (long_format) {
                Sizable* sizable = child->as<Sizable>();
                std::cout << kind_of(child) << " " << std::setw(12)
                          << (sizable ? std::to_string(sizable->size()) : std::string("-")) << " ";
            }
            std::cout << display_name(child) << std::endl;
        }
    }
    return 0;
}

int cmd_tree(const Registry& registry, const std::vector<std::string>& args) {
    for (const auto& address : args) {
        NodePtr top = registry.resolve(address);
        size_t base_depth = top->path().components().size();
        // Links are shown, not walked, so link cycles still terminate
        for (const auto& node : top->require<Listable>().recurse(Listable::stop_at_links)) {
            size_t depth = node->path().components().size() - base_depth;
            std::string label = depth == 0 ? node->path().str() : display_name(node);
            if (kind_of(node) == "d" && depth > 0) {
                label += "/";
            }
            std::cout << std::string(depth * 2, ' ') << label << std::endl;
        }
    }
    return 0;
}

int cmd_cat(const Registry& registry, const std::vector<std::string>& args) {
    for (const auto& address : args) {
        NodePtr node = registry.resolve(address);
        for (const auto& block : node->require<Readable>().read_blocks()) {
            std::cout.write(reinterpret_cast<const char*>(block.data()),
                            static_cast<std::streamsize>(block.size()));
        }
    }
    std::cout.flush();
    return 0;
}

int cmd_cp(const Registry& registry, const std::vector<std::string>& args, const CopyOptions& options) {
    if (args.size() != 2) {
        std::cerr << "Error: cp takes a source and a destination" << std::endl;
        return 1;
    }
    NodePtr source = registry.resolve(args[0]);
    NodePtr destination = registry.resolve(args[1]);

    // Copying onto a folder places the source inside it
    Readable* dest_readable = destination->as<Readable>();
    if (dest_readable && dest_readable->is_folder() && !source->path().is_root()) {
        destination = destination->require<Hierarchy>().child(source->path().name());
    }
    source->require<Readable>().copy_to(*destination, options);
    return 0;
}

int cmd_rm(const Registry& registry, const std::vector<std::string>& args, bool force) {
    for (const auto& address : args) {
        registry.resolve(address)->require<Writable>().remove(force);
    }
    return 0;
}

int cmd_mkdir(const Registry& registry, const std::vector<std::string>& args, bool parents) {
    for (const auto& address : args) {
        Writable& writable = registry.resolve(address)->require<Writable>();
        if (parents) {
            writable.mkdirs(true);
        } else {
            writable.mkdir();
        }
    }
    return 0;
}

int cmd_hash(const Registry& registry, const std::vector<std::string>& args, const std::string& algorithm) {
    for (const auto& address : args) {
        std::cout << registry.resolve(address)->require<Readable>().hash(algorithm)
                  << "  " << address << std::endl;
    }
    return 0;
}

std::string human_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << units[unit];
    return out.str();
}

int cmd_mounts(const Registry& registry, const std::vector<std::string>& args) {
    std::vector<std::string> targets = args.empty() ? std::vector<std::string>{"/"} : args;
    for (const auto& address : targets) {
        FileSystemPtr filesystem = registry.resolve(address)->filesystem();
        for (const auto& mount : filesystem->mountpoints()) {
            std::cout << std::left << std::setw(24)
                      << (mount->device_name().empty() ? "-" : mount->device_name())
                      << std::setw(10) << (mount->type().empty() ? "-" : mount->type())
                      << mount->location()->path().str();
            std::optional<DiskUsage> usage;
            try {
                usage = mount->usage();
            } catch (const FSError& e) {
                std::cerr << "[nodefs] Warning: " << e.what() << std::endl;
            }
            if (usage) {
                std::cout << "  " << human_bytes(usage->space.used) << "/"
                          << human_bytes(usage->space.total) << " used, "
                          << human_bytes(usage->space.available) << " available";
            }
            std::cout << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    po::options_description desc("nodefs");
    desc.add_options()
        ("help,h", "Show help")
        ("config,c", po::value<std::string>(), "YAML config naming filesystems for @name addresses")
        ("long,l", po::bool_switch(), "ls: show type and size")
        ("parents,p", po::bool_switch(), "mkdir: create missing parents, no error if present")
        ("force,f", po::bool_switch(), "rm: ignore missing targets")
        ("overwrite", po::bool_switch(), "cp: replace an existing destination")
        ("no-dereference,P", po::bool_switch(), "cp: copy links as links")
        ("xattrs", po::bool_switch(), "cp: copy extended attributes")
        ("algorithm,a", po::value<std::string>()->default_value("md5"), "hash: digest name");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "Subcommand")
        ("args", po::value<std::vector<std::string>>()->multitoken(), "Addresses");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::cout << "nodefs - browse and copy across local, memory, FTP and HTTP filesystems\n\n";
        std::cout << "Usage: " << argv[0] << " [options] <command> [addresses...]\n\n";
        std::cout << "Commands: ls, tree, cat, cp, rm, mkdir, hash, mounts\n\n";
        std::cout << desc << std::endl;
        std::cout << "\nExamples:\n";
        std::cout << "  " << argv[0] << " -c fs.yaml ls -l @archive/data\n";
        std::cout << "  " << argv[0] << " -c fs.yaml cp @archive/data/run.bin /tmp/\n";
        std::cout << "  " << argv[0] << " hash -a sha256 https://example.org/index.html\n";
        return vm.count("help") ? 0 : 1;
    }

    std::string command = vm["command"].as<std::string>();
    std::vector<std::string> args;
    if (vm.count("args")) {
        args = vm["args"].as<std::vector<std::string>>();
    }

    try {
        Registry registry;
        if (vm.count("config")) {
            registry.load_config(vm["config"].as<std::string>());
        }

        if (command != "mounts" && args.empty()) {
            std::cerr << "Error: " << command << " needs at least one address" << std::endl;
            return 1;
        }

        if (command == "ls") {
            return cmd_ls(registry, args, vm["long"].as<bool>());
        } else if (command == "tree") {
            return cmd_tree(registry, args);
        } else if (command == "cat") {
            return cmd_cat(registry, args);
        } else if (command == "cp") {
            CopyOptions options;
            options.overwrite = vm["overwrite"].as<bool>();
            options.dereference_links = !vm["no-dereference"].as<bool>();
            options.copy_xattrs = vm["xattrs"].as<bool>();
            return cmd_cp(registry, args, options);
        } else if (command == "rm") {
            return cmd_rm(registry, args, vm["force"].as<bool>());
        } else if (command == "mkdir") {
            return cmd_mkdir(registry, args, vm["parents"].as<bool>());
        } else if (command == "hash") {
            return cmd_hash(registry, args, vm["algorithm"].as<std::string>());
        } else if (command == "mounts") {
            return cmd_mounts(registry, args);
        }

        std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
        return 1;
    } catch (const FSError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
