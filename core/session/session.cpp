#include "session.hpp"

#include <exception>
#include <utility>

#include "errors/errors.hpp"
#include "logging/logger.hpp"

namespace vibium {
namespace session {

std::unique_ptr<Session> Session::launch(const LaunchOptions &options) {
    return launch(options, binary::BinaryResolver());
}

std::unique_ptr<Session> Session::launch(const LaunchOptions &options, const binary::BinaryResolver &resolver) {
    std::shared_ptr<process::ClickerProcess> proc = process::ClickerProcess::start(options.process, resolver);
    std::string url = "ws://localhost:" + std::to_string(proc->port());

    std::shared_ptr<protocol::ProtocolClient> client;
    try {
        client = protocol::ProtocolClient::connect(url, options.client);
    } catch (const std::exception &e) {
        LOG_ERROR("[Session] Connecting to " << url << " failed, stopping clicker: " << e.what());
        proc->stop();
        throw;
    }

    auto session = std::make_unique<Session>(PrivateTag(), std::move(proc), std::move(client), url);
    session->attach_process_failures();
    LOG_INFO("[Session] Launched on " << url);
    return session;
}

std::unique_ptr<Session> Session::connect(const std::string &url, const protocol::ClientOptions &options) {
    std::shared_ptr<protocol::ProtocolClient> client = protocol::ProtocolClient::connect(url, options);
    LOG_INFO("[Session] Attached to " << url);
    return std::make_unique<Session>(PrivateTag(), nullptr, std::move(client), url);
}

Session::Session(PrivateTag, std::shared_ptr<process::ClickerProcess> process,
                 std::shared_ptr<protocol::ProtocolClient> client, std::string url)
    : process_(std::move(process)), client_(std::move(client)), url_(std::move(url)) {}

Session::~Session() { close(); }

void Session::attach_process_failures() {
    std::weak_ptr<protocol::ProtocolClient> weak_client = client_;
    std::weak_ptr<process::ClickerProcess> weak_process = process_;

    process_->on_exit([weak_client](int exit_code, const std::string &output) {
        if (auto client = weak_client.lock()) {
            client->fail_all(std::make_exception_ptr(ProcessCrashedError(exit_code, output)));
        }
    });

    // The socket usually drops before the watcher reports the exit; give the
    // process a moment so pending commands see the crash rather than a bare disconnect.
    client_->set_disconnect_cause_resolver([weak_process](const std::string &) -> std::exception_ptr {
        auto proc = weak_process.lock();
        if (!proc) {
            return nullptr;
        }
        auto exit_code = proc->wait_for_exit(kCrashAttributionMs);
        if (!exit_code || proc->state() != process::ProcessState::CRASHED) {
            return nullptr;
        }
        return std::make_exception_ptr(ProcessCrashedError(*exit_code, proc->output()));
    });
}

void Session::close() {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    LOG_DEBUG("[Session] Closing " << url_);
    if (client_) {
        client_->close();
    }
    if (process_) {
        process_->stop();
    }
}

bool Session::is_connected() const { return client_ && client_->is_connected(); }

}  // namespace session
}  // namespace vibium
