#include "wizctl/tool/probe_cli.hpp"
#include "wizctl/discovery/discovery_collector.hpp"
#include "wizctl/exchange/exchange.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <vector>

namespace wizctl
{

namespace
{

int count_verbosity(const std::vector<std::string>& arguments)
{
    int verbosity = 0;
    for (size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        if (argument.size() >= 2 && argument[0] == '-' && argument[1] == 'v')
        {
            size_t v_count = 0;
            for (size_t j = 1; j < argument.size() && argument[j] == 'v'; ++j)
            {
                ++v_count;
            }

            if (v_count == argument.size() - 1)
            {
                verbosity = static_cast<int>(v_count);
                break;
            }
        }
    }
    return verbosity;
}

logging::LogLevel level_for_verbosity(int verbosity)
{
    switch (verbosity)
    {
    case 0:
        return logging::LogLevel::Warning;
    case 1:
        return logging::LogLevel::Info;
    case 2:
        return logging::LogLevel::Debug;
    default:
        return logging::LogLevel::Trace;
    }
}

RetryStrategy parse_strategy(const std::string& text)
{
    if (text == "fixed")
    {
        return RetryStrategy::fixed;
    }
    if (text == "exponential")
    {
        return RetryStrategy::exponential;
    }
    throw boost::program_options::error("--strategy must be 'fixed' or 'exponential', got '" + text + "'");
}

} // namespace

ProbeConfig parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    po::options_description desc("wizctl_probe Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("mode,m", po::value<std::string>()->default_value("discover"), "discover | send")
        ("address,a", po::value<std::vector<std::string>>()->composing(), "Device address (send mode, repeatable)")
        ("broadcast,b", po::value<std::string>(), "Broadcast address (discover mode)")
        ("all-interfaces", "Discover on every local IPv4 interface")
        ("method", po::value<std::string>(), "Method to send (default getPilot)")
        ("params", po::value<std::string>(), "Method parameters as a JSON object")
        ("port,p", po::value<unsigned short>(), "UDP port (default 38899)")
        ("timeout,t", po::value<long>(), "Per-attempt timeout in milliseconds (send mode)")
        ("window,w", po::value<long>(), "Discovery window in milliseconds")
        ("retries,r", po::value<std::size_t>(), "Number of retries")
        ("strategy", po::value<std::string>(), "Retry strategy: fixed | exponential")
        ("interval", po::value<long>(), "First retry interval in milliseconds")
        ("cap", po::value<long>(), "Largest exponential retry interval in milliseconds");
    // clang-format on

    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    const int verbosity = count_verbosity(arguments);

    po::variables_map variables;

    ProbeConfig config;

    try
    {
        auto parser = po::command_line_parser(arguments).options(desc).allow_unregistered();

        po::store(parser.run(), variables);
        po::notify(variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : shows ERROR and WARNING messages\n"
                      << "  -v      : adds INFO messages\n"
                      << "  -vv     : adds DEBUG messages\n"
                      << "  -vvv    : shows all messages\n"
                      << "\nExamples:\n"
                      << "  wizctl_probe --mode discover --window 5000\n"
                      << "  wizctl_probe --mode send -a 192.168.1.20 --method setPilot --params '{\"state\":true}'\n";
            std::exit(0);
        }

        const std::string mode = variables["mode"].as<std::string>();
        if (mode == "discover")
        {
            config.mode  = ProbeMode::discover;
            config.retry = default_discovery_retry_policy();
        }
        else if (mode == "send")
        {
            config.mode  = ProbeMode::send;
            config.retry = default_send_retry_policy();
        }
        else
        {
            throw po::error("--mode must be 'discover' or 'send', got '" + mode + "'");
        }

        if (variables.count("address") != 0U)
        {
            config.addresses = variables["address"].as<std::vector<std::string>>();
        }
        if (config.mode == ProbeMode::send && config.addresses.empty())
        {
            throw po::error("send mode needs at least one --address");
        }

        if (variables.count("broadcast") != 0U)
        {
            config.broadcast_address = variables["broadcast"].as<std::string>();
        }
        config.all_interfaces = variables.count("all-interfaces") != 0U;

        if (variables.count("method") != 0U)
        {
            config.method = variables["method"].as<std::string>();
        }
        if (variables.count("params") != 0U)
        {
            config.params = nlohmann::json::parse(variables["params"].as<std::string>(), nullptr, false);
            if (config.params.is_discarded() || !config.params.is_object())
            {
                throw po::error("--params must be a JSON object");
            }
        }

        if (variables.count("port") != 0U)
        {
            config.port = variables["port"].as<unsigned short>();
        }
        if (variables.count("timeout") != 0U)
        {
            config.timeout = std::chrono::milliseconds(variables["timeout"].as<long>());
        }
        if (variables.count("window") != 0U)
        {
            config.window = std::chrono::milliseconds(variables["window"].as<long>());
        }
        if (config.timeout.count() < 0 || config.window.count() < 0)
        {
            throw po::error("--timeout and --window must not be negative");
        }

        if (variables.count("retries") != 0U || variables.count("strategy") != 0U || variables.count("interval") != 0U
            || variables.count("cap") != 0U)
        {
            const std::size_t retries = variables.count("retries") != 0U ? variables["retries"].as<std::size_t>() : config.retry.max_retries();
            const RetryStrategy strategy =
                variables.count("strategy") != 0U ? parse_strategy(variables["strategy"].as<std::string>()) : config.retry.strategy();
            const auto interval =
                variables.count("interval") != 0U ? std::chrono::milliseconds(variables["interval"].as<long>()) : config.retry.base_interval();
            std::optional<std::chrono::milliseconds> cap = config.retry.cap_interval();
            if (variables.count("cap") != 0U)
            {
                cap = std::chrono::milliseconds(variables["cap"].as<long>());
            }
            config.retry = RetryPolicy(retries, strategy, interval, cap);
        }

        config.log_level = level_for_verbosity(verbosity);

        logging::ConsoleLogger logger(config.log_level);
        WIZCTL_LOG_DEBUG(logger, "Verbosity level: " << verbosity);
        WIZCTL_LOG_DEBUG(logger, "Mode: " << mode);
        WIZCTL_LOG_DEBUG(logger, "Retry: " << to_string(config.retry.strategy()) << ", " << config.retry.max_retries() << " retries from "
                                           << config.retry.base_interval().count() << "ms");
        WIZCTL_LOG_TRACE(logger, "Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

} // namespace wizctl
