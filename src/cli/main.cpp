#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>
#include <casket/utils/string.hpp>

#include <tlsfp/ja3.hpp>

using namespace casket;
using namespace casket::opt;
using namespace tlsfp::ja3;

static inline Level ParseLogLevel(std::string_view str)
{
    if (iequals(str, "error"))
    {
        return Level::Error;
    }
    else if (iequals(str, "warn"))
    {
        return Level::Warning;
    }
    else if (iequals(str, "info"))
    {
        return Level::Info;
    }
    else if (iequals(str, "debug"))
    {
        return Level::Debug;
    }

    return Level::Emergency;
}

struct Options
{
    std::string input;
    std::string logLevel;
};

static void InitParser(CmdLineOptionsParser& parser, Options& options)
{
    // clang-format off
    parser.add(
        OptionBuilder("help")
            .setDescription("Print help message")
            .build()
    );
    parser.add(
        OptionBuilder("input", Value(&options.input))
            .setDescription("Fingerprint string, e.g. '771,4865-4866,0-23,29,0'")
            .setRequired()
            .build()
    );
    parser.add(
        OptionBuilder("server")
            .setDescription("Decode as JA3S (server) fingerprint")
            .build()
    );
    parser.add(
        OptionBuilder("log-level", Value(&options.logLevel))
            .setDescription("Log level: error, warn, info, debug")
            .setDefaultValue("warn")
            .build()
    );
    // clang-format on
}

int main(int argc, char* argv[])
{
    CmdLineOptionsParser parser;
    Options options;

    try
    {
        InitParser(parser, options);

        std::vector<std::string_view> args(argv + 1, argv + argc);
        parser.parse(args);

        if (args.empty() || parser.isUsed("help"))
        {
            parser.help(std::cout, "tlsfp");
            return EXIT_SUCCESS;
        }
        parser.validate();

        LogManager::Instance().enable(Type::Console);
        LogManager::Instance().setLevel(ParseLogLevel(options.logLevel));

        FingerprintPrinter printer(std::cout);
        if (parser.isUsed("server"))
        {
            printer.print(ServerFingerprint::parse(options.input));
        }
        else
        {
            printer.print(ClientFingerprint::parse(options.input));
        }
    }
    catch (const std::system_error& e)
    {
        std::cerr << e.what() << " [" << e.code() << "]" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
