// treedit: apply one structural edit to a JSON file.
//
//   treedit [options] FILE COMMAND [ARGS...]
//
// Paths are RFC 6901 pointers ("" is the root, "/a/0" is element 0 of "a").

#include <treedit/treedit.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitOk     = 0;
constexpr int kExitEngine = 1;
constexpr int kExitUsage  = 2;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Args {
    std::string file;
    std::string command;
    std::vector<std::string> operands;
    std::string config;
    bool dry_run = false;
    bool compact = false;
    bool verbose = false;
};

void print_usage(std::ostream& os) {
    os << "usage: treedit [--config FILE] [--dry-run] [--compact] [-v] FILE COMMAND [ARGS]\n"
          "\n"
          "commands:\n"
          "  print                      print the document\n"
          "  tree                       print the path table\n"
          "  get PTR                    print the node at PTR\n"
          "  set PTR TEXT               replace the node at PTR (TEXT parsed, else a string)\n"
          "  rename PTR KEY             rename an object entry\n"
          "  add PTR [KEY]              add an empty child to the container at PTR\n"
          "  delete PTR                 delete a subtree\n"
          "  transfer PTR               delete a container and move its content to its parent\n"
          "  move SRC DST before|after|nest\n"
          "  group NAME PTR PTR...      group nodes under NAME\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw UsageError("--config requires a file");
            args.config = argv[++i];
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) positional.emplace_back(argv[i]);
        } else if (arg.size() > 1 && arg[0] == '-' && positional.size() < 2) {
            throw UsageError("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2) throw UsageError("missing FILE or COMMAND");
    args.file = positional[0];
    args.command = positional[1];
    args.operands.assign(positional.begin() + 2, positional.end());
    return args;
}

void expect_operands(const Args& args, size_t min, size_t max) {
    const size_t n = args.operands.size();
    if (n < min || n > max)
        throw UsageError("wrong number of arguments for " + args.command);
}

void print_tree(const std::vector<treedit::TreeEntry>& table) {
    for (const auto& e : table) {
        std::cout << std::string(e.path.depth() * 2, ' ') << e.label;
        if (e.path.empty() || treedit::is_container(e.type)) {
            std::cout << ' ' << e.preview;
        } else {
            std::cout << ": " << e.preview;
        }
        std::cout << "  " << e.path.to_pointer() << '\n';
    }
}

int run(const Args& args) {
    treedit::EditorOptions opts;
    if (!args.config.empty()) {
        opts = treedit::EditorOptions::from_node(treedit::load_file(args.config));
    }
    if (args.compact) opts.print.indent = -1;
    spdlog::set_level(args.verbose ? spdlog::level::debug : opts.log_level);

    treedit::Editor ed(opts);
    ed.load(args.file);
    auto ptr = [&](const std::string& text) {
        return treedit::Path::from_pointer(text, ed.document());
    };

    const std::string& cmd = args.command;
    const auto& ops = args.operands;

    if (cmd == "print") {
        expect_operands(args, 0, 0);
        std::cout << ed.text() << '\n';
        return kExitOk;
    }
    if (cmd == "tree") {
        expect_operands(args, 0, 0);
        print_tree(ed.projection());
        return kExitOk;
    }
    if (cmd == "get") {
        expect_operands(args, 1, 1);
        std::cout << treedit::print(treedit::resolve(ed.document(), ptr(ops[0])), opts.print)
                  << '\n';
        return kExitOk;
    }

    treedit::Path changed;
    if (cmd == "set") {
        expect_operands(args, 2, 2);
        changed = ed.set_value(ptr(ops[0]), ops[1]);
    } else if (cmd == "rename") {
        expect_operands(args, 2, 2);
        changed = ed.rename_key(ptr(ops[0]), ops[1]);
    } else if (cmd == "add") {
        expect_operands(args, 1, 2);
        std::optional<std::string> key;
        if (ops.size() == 2) key = ops[1];
        changed = ed.add_child(ptr(ops[0]), key);
    } else if (cmd == "delete") {
        expect_operands(args, 1, 1);
        changed = ed.delete_subtree(ptr(ops[0]));
    } else if (cmd == "transfer") {
        expect_operands(args, 1, 1);
        changed = ed.delete_and_transfer(ptr(ops[0]));
    } else if (cmd == "move") {
        expect_operands(args, 3, 3);
        const auto mode = treedit::parse_move_mode(ops[2]);
        if (!mode) throw UsageError("move mode must be before, after or nest");
        changed = ed.move(ptr(ops[0]), ptr(ops[1]), *mode);
    } else if (cmd == "group") {
        if (ops.size() < 3) throw UsageError("group needs a NAME and at least two paths");
        std::vector<treedit::Path> selected;
        for (size_t i = 1; i < ops.size(); ++i) selected.push_back(ptr(ops[i]));
        const auto groups = ed.group_nodes(selected, ops[0]);
        if (!groups.empty()) changed = groups.front();
    } else {
        throw UsageError("unknown command " + cmd);
    }

    if (args.dry_run) {
        std::cout << ed.text() << '\n';
    } else {
        ed.save(args.file);
    }
    std::cerr << cmd << ": " << (changed.empty() ? "(root)" : changed.to_pointer()) << '\n';
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("treedit"));

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "treedit: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    try {
        return run(args);
    } catch (const UsageError& e) {
        std::cerr << "treedit: " << e.what() << '\n';
        return kExitUsage;
    } catch (const treedit::EditError& e) {
        std::cerr << "treedit: " << e.what();
        for (const auto& p : e.paths()) std::cerr << " [" << (p.empty() ? "(root)" : p) << ']';
        std::cerr << '\n';
        return kExitEngine;
    } catch (const std::system_error& e) {
        std::cerr << "treedit: " << e.what() << '\n';
        return kExitEngine;
    }
}
