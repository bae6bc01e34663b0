#include "abigate/build_pipeline.hpp"
#include "abigate/host_abi.hpp"
#include "abigate/policy_engine.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{
using abigate::HostAbi;
using abigate::ImportDescriptor;

struct Options
{
    std::string module_path;
    std::optional<std::string> compile_command;
    bool list_imports{false};
    bool print_host_abi{false};
    bool verbose{false};
};

[[noreturn]] void print_usage_and_exit(const std::string& program, int status)
{
    std::cerr << "Usage: " << program << " [options] <module.wasm>\n"
              << "Checks that a compiled reducer module imports only the sanctioned host ABI.\n"
              << "Options:\n"
              << "  --compile-cmd <command>  Run the compiler command before validating\n"
              << "  --list-imports           Print the module's imports after validation\n"
              << "  --print-host-abi         Print the sanctioned host interface and exit\n"
              << "  --verbose                Report pipeline progress on stderr\n"
              << "  -h, --help               Show this message\n"
              << "Only the functions listed by --print-host-abi may be imported; any other name,\n"
              << "including one under the host namespace, is rejected.\n"
              << "Exit status: 0 passed, 1 forbidden imports, 2 malformed module, 3 tool error\n";
    std::exit(status);
}

Options parse_options(int argc, char** argv)
{
    const std::string program = argc > 0 ? argv[0] : "abigate_check";
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage_and_exit(program, EXIT_SUCCESS);
        }
        else if (arg == "--compile-cmd")
        {
            if (i + 1 >= argc)
            {
                throw std::runtime_error("--compile-cmd requires a command");
            }
            options.compile_command = argv[++i];
        }
        else if (arg == "--list-imports")
        {
            options.list_imports = true;
        }
        else if (arg == "--print-host-abi")
        {
            options.print_host_abi = true;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            throw std::runtime_error("unknown option: " + std::string(arg));
        }
        else if (options.module_path.empty())
        {
            options.module_path = std::string(arg);
        }
        else
        {
            throw std::runtime_error("unexpected argument: " + std::string(arg));
        }
    }

    if (options.module_path.empty() && !options.print_host_abi)
    {
        print_usage_and_exit(program, abigate::kExitToolError);
    }
    return options;
}

void print_host_abi(const HostAbi& abi)
{
    std::cout << "Host ABI " << abi.namespace_name() << " (compatible: " << abi.prefix << "_"
              << abi.version.major << ".0 through " << abi.namespace_name() << ")\n";
    for (const auto& function : abi.functions)
    {
        std::cout << "  " << function.name << " : func ";
        if (function.signature)
        {
            std::cout << abigate::to_string(*function.signature) << "\n";
        }
        else
        {
            std::cout << "(any signature)\n";
        }
    }
    std::cout << "Every other import, including other names under " << abi.namespace_name()
              << ", is rejected.\n";
}

void print_imports(const std::vector<ImportDescriptor>& imports)
{
    if (imports.empty())
    {
        std::cout << "Imports: (none)\n";
        return;
    }
    std::cout << "Imports:\n";
    for (const auto& import : imports)
    {
        std::cout << "  " << import.module_name << "." << import.name << " : "
                  << abigate::describe_import_type(import) << "\n";
    }
}
} // namespace

int main(int argc, char** argv)
try
{
    const auto options = parse_options(argc, argv);
    const auto abi = abigate::default_host_abi();

    if (options.print_host_abi)
    {
        print_host_abi(abi);
        return EXIT_SUCCESS;
    }

    const auto engine = abigate::default_policy_engine(abi);
    abigate::BuildStep step{options.module_path, options.compile_command, options.verbose};
    if (options.list_imports)
    {
        step.on_imports = print_imports;
    }
    return abigate::run_build_step(step, engine, std::cerr);
}
catch (const std::exception& ex)
{
    std::cerr << "error: " << ex.what() << '\n';
    return abigate::kExitToolError;
}
