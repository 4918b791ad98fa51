#include "wizctl/discovery/discovery_collector.hpp"
#include "wizctl/errors/wiz_errors.hpp"
#include "wizctl/net/network_utils.hpp"

#include "boost/asio/error.hpp"
#include "boost/asio/post.hpp"

#include <utility>

namespace wizctl
{

DiscoveryCollector::DiscoveryCollector(boost::asio::io_context& io_context, const boost::asio::ip::udp::endpoint& broadcast_endpoint,
                                       std::chrono::milliseconds total_timeout, const RetryPolicy& retry, logging::Logger& logger,
                                       const boost::asio::ip::address_v4& local_address)
    : _io_context(io_context)
    , _logger(logger)
    , _transport(io_context, logger, true, local_address)
    , _broadcast_endpoint(broadcast_endpoint)
    , _total_timeout(total_timeout)
    , _retry(retry)
    , _payload(std::make_shared<const std::string>(protocol::make_registration_request().dump()))
    , _window_timer(io_context)
    , _repeat_timer(io_context)
    , _current_interval(retry.base_interval())
{
}

bool DiscoveryCollector::async_start(std::function<void()> on_complete)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(DiscoveryState::running) || _complete)
        {
            return false;
        }

        _flags.set_flag(DiscoveryState::running);
        _on_complete = std::move(on_complete);
    }

    WIZCTL_LOG_INFO(_logger, "Broadcasting to " << _broadcast_endpoint << ", collecting responses for " << _total_timeout.count() << "ms");
    WIZCTL_LOG_DEBUG(_logger, "Broadcast: " << *_payload);

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);

                          _window_start = std::chrono::steady_clock::now();
                          _flags.set_flag(DiscoveryState::window_open);
                          _flags.set_flag(DiscoveryState::window_timer_running);
                          _window_timer.expires_at(saturating_deadline(_window_start, _total_timeout));
                          _window_timer.async_wait([this](const boost::system::error_code& error_code)
                                                   { handle_window_closed(error_code); });

                          start_receive();
                          send_broadcast();

                          if (_retry.enabled())
                          {
                              schedule_repeat();
                          }
                      });

    return true;
}

void DiscoveryCollector::start_receive()
{
    _flags.set_flag(DiscoveryState::receiving_async);
    _transport.async_receive([this](const boost::system::error_code& error_code, const Datagram& datagram)
                             { handle_receive(error_code, datagram); });
}

void DiscoveryCollector::send_broadcast()
{
    ++_sends_in_flight;
    ++_broadcasts_sent;
    WIZCTL_LOG_TRACE(_logger, "Sending broadcast #" << _broadcasts_sent << " to " << _broadcast_endpoint);
    _transport.async_send_to(_payload, _broadcast_endpoint,
                             [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                             { handle_send(error_code, bytes_transferred); });
}

void DiscoveryCollector::schedule_repeat()
{
    _flags.set_flag(DiscoveryState::repeat_timer_running);
    _repeat_timer.expires_at(saturating_deadline(std::chrono::steady_clock::now(), _current_interval));
    _repeat_timer.async_wait([this](const boost::system::error_code& error_code) { handle_repeat(error_code); });
}

void DiscoveryCollector::handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    --_sends_in_flight;

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            WIZCTL_LOG_TRACE(_logger, "Broadcast sending aborted.");
        }
        else
        {
            WIZCTL_LOG_ERROR(_logger, "Failed to send broadcast: " << error_code.message());
        }
    }
    else if (bytes_transferred != _payload->size())
    {
        WIZCTL_LOG_ERROR(_logger, "Incomplete broadcast: " << bytes_transferred << "/" << _payload->size() << " bytes");
    }

    resolve_on_completed();
}

void DiscoveryCollector::handle_receive(const boost::system::error_code& error_code, const Datagram& datagram)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(DiscoveryState::receiving_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            WIZCTL_LOG_TRACE(_logger, "Discovery response receiving aborted.");
        }
        else
        {
            WIZCTL_LOG_ERROR(_logger, "Error receiving discovery response: " << error_code.message());
        }
    }
    else if (_flags.get_flag(DiscoveryState::window_open))
    {
        WIZCTL_LOG_DEBUG(_logger, "Response from " << datagram.sender << ": " << datagram.payload);

        nlohmann::json response = nlohmann::json::parse(datagram.payload, nullptr, false);
        auto device             = response.is_discarded() ? std::nullopt
                                                          : DiscoveredDevice::from_json(response, datagram.sender.address().to_string());
        if (!device)
        {
            WIZCTL_LOG_WARNING(_logger, "Ignoring malformed response from " << datagram.sender);
        }
        else if (_seen_macs.insert(device->mac).second)
        {
            WIZCTL_LOG_INFO(_logger, "Discovered " << *device);
            _devices.push_back(std::move(*device));
        }
        else
        {
            WIZCTL_LOG_TRACE(_logger, "Duplicate response from " << device->mac);
        }
    }

    if (_flags.get_flag(DiscoveryState::window_open) && error_code != boost::asio::error::operation_aborted)
    {
        start_receive();
        return;
    }
    resolve_on_completed();
}

void DiscoveryCollector::handle_repeat(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(DiscoveryState::repeat_timer_running);

    if (error_code == boost::asio::error::operation_aborted || !_flags.get_flag(DiscoveryState::window_open))
    {
        resolve_on_completed();
        return;
    }

    if (std::chrono::steady_clock::now() >= saturating_deadline(_window_start, _total_timeout))
    {
        WIZCTL_LOG_DEBUG(_logger, "Window elapsed, suppressing remaining " << (_retry.max_retries() - _repeats_sent) << " broadcast(s)");
        resolve_on_completed();
        return;
    }

    ++_repeats_sent;
    WIZCTL_LOG_DEBUG(_logger, "Repeat broadcast " << _repeats_sent << "/" << _retry.max_retries());
    send_broadcast();

    if (_repeats_sent < _retry.max_retries())
    {
        _current_interval = _retry.next_interval(_current_interval);
        schedule_repeat();
    }
}

void DiscoveryCollector::handle_window_closed(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(DiscoveryState::window_timer_running);
    _flags.clear_flag(DiscoveryState::window_open);

    if (error_code == boost::asio::error::operation_aborted)
    {
        WIZCTL_LOG_TRACE(_logger, "Window timer aborted.");
    }
    else if (error_code)
    {
        WIZCTL_LOG_ERROR(_logger, "Timer error: " << error_code.message());
    }
    else
    {
        WIZCTL_LOG_INFO(_logger, "Discovery complete: " << _devices.size() << " device(s)");
    }

    _repeat_timer.cancel();
    _transport.cancel();
    resolve_on_completed();
}

void DiscoveryCollector::resolve_on_completed()
{
    if (!_flags.get_flag(DiscoveryState::running) || _flags.get_flag(DiscoveryState::window_open))
    {
        return;
    }

    if (_flags.any_of({DiscoveryState::window_timer_running, DiscoveryState::repeat_timer_running, DiscoveryState::receiving_async}) ||
        _sends_in_flight > 0)
    {
        return;
    }

    _flags.clear_flag(DiscoveryState::running);
    _complete = true;
    _transport.close();

    if (_on_complete)
    {
        boost::asio::post(_io_context, std::move(_on_complete));
        _on_complete = nullptr;
    }
}

std::vector<DiscoveredDevice> DiscoveryCollector::devices() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _devices;
}

std::size_t DiscoveryCollector::broadcasts_sent() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _broadcasts_sent;
}

bool DiscoveryCollector::is_complete() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _complete;
}

RetryPolicy default_discovery_retry_policy()
{
    return RetryPolicy::exponential(protocol::discovery_retries, protocol::discovery_first_interval, protocol::max_backoff);
}

std::vector<DiscoveredDevice> discover(const std::string& broadcast_address, std::chrono::milliseconds total_timeout,
                                       const RetryPolicy& retry, unsigned short port, logging::Logger& logger,
                                       const std::string& local_address)
{
    auto broadcast_endpoint = make_endpoint(broadcast_address, port);
    auto bind_address       = local_address.empty() ? boost::asio::ip::address_v4::any() : make_endpoint(local_address, 0).address().to_v4();

    boost::asio::io_context io_context;
    DiscoveryCollector collector(io_context, broadcast_endpoint, total_timeout, retry, logger, bind_address);
    collector.async_start();
    io_context.run();

    return collector.devices();
}

std::vector<DiscoveredDevice> merge_interface_discoveries(const std::vector<NetworkInterface>& interfaces,
                                                          const InterfaceDiscovery& discover_on, logging::Logger& logger)
{
    std::vector<DiscoveredDevice> all_devices;
    std::unordered_set<std::string> seen_macs;

    for (const auto& network_interface : interfaces)
    {
        WIZCTL_LOG_INFO(logger, "Discovering on " << network_interface.name << " (" << network_interface.address << ")");
        try
        {
            for (auto& device : discover_on(network_interface))
            {
                if (seen_macs.insert(device.mac).second)
                {
                    all_devices.push_back(std::move(device));
                }
            }
        }
        catch (const WizError& error)
        {
            WIZCTL_LOG_WARNING(logger, "Discovery on " << network_interface.name << " failed: " << error.what());
        }
    }

    return all_devices;
}

std::vector<DiscoveredDevice> discover_on_all_interfaces(std::chrono::milliseconds total_timeout, const RetryPolicy& retry,
                                                         unsigned short port, logging::Logger& logger)
{
    return merge_interface_discoveries(
        list_ipv4_interfaces(logger),
        [&](const NetworkInterface& network_interface)
        {
            return discover(protocol::default_broadcast_address, total_timeout, retry, port, logger,
                            network_interface.address.to_string());
        },
        logger);
}

} // namespace wizctl
