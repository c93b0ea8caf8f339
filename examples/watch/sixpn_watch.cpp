#include <sixpn/config/config.h>
#include <sixpn/config/settings.h>
#include <sixpn/core/log.h>
#include <sixpn/core/metrics.h>
#include <sixpn/discovery/discovery_engine.h>
#include <sixpn/dns/dns_client.h>
#include <sixpn/runtime/app.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

void Usage() {
    std::cerr << "usage: sixpn_watch [--config file] [--service name:port[:nearest]]... [--dns host]\n"
                 "                   [--log level] [--threads n] [--metrics]\n";
}

// Registers the watched services, then logs every change of their instances.
class Watcher final : public sixpn::IComponent {
public:
    Watcher(sixpn::App& app, std::shared_ptr<sixpn::discovery::DiscoveryEngine> engine,
            std::vector<sixpn::discovery::Service> services, bool print_metrics)
        : app_(app), engine_(std::move(engine)), services_(std::move(services)), print_metrics_(print_metrics) {}

    void Start() override {
        engine_->Register(services_, [this](sixpn::Status st) {
            if (!st.ok()) {
                sixpn::log::error("Registration failed: {}", st.ToString());
                app_.RequestStop();
                return;
            }
            for (const auto& svc : services_) {
                Watch(svc);
            }
        });
    }

    void Stop() override {
        sixpn::discovery::ShutdownAndWait(*engine_);
        for (const auto& t : tokens_) {
            t.Cancel();
        }
        if (print_metrics_) {
            std::cout << sixpn::DefaultMetrics().ToPrometheusText();
        }
    }

private:
    // Runs on the engine's strand.
    void Watch(const sixpn::discovery::Service& svc) {
        auto name = svc.ToString();
        tokens_.push_back(engine_->Subscribe(
            svc,
            [name](const sixpn::discovery::InstancesResult& r) {
                if (!r.ok()) {
                    sixpn::log::warn("{}: {}", name, r.status().ToString());
                    return;
                }
                sixpn::log::info("{} -> {}", name, sixpn::discovery::ToString(r.value()));
            },
            [name](sixpn::discovery::CompletionReason reason) {
                sixpn::log::info("{}: subscription ended ({})", name, sixpn::discovery::ToString(reason));
            }));
    }

    sixpn::App& app_;
    std::shared_ptr<sixpn::discovery::DiscoveryEngine> engine_;
    std::vector<sixpn::discovery::Service> services_;
    bool print_metrics_;
    std::vector<sixpn::discovery::CancellationToken> tokens_;
};

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> service_args;
    std::string dns_override;
    std::string log_override;
    int threads_override = -1;
    bool print_metrics = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--service" && i + 1 < argc) {
            service_args.emplace_back(argv[++i]);
        } else if (a == "--dns" && i + 1 < argc) {
            dns_override = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_override = argv[++i];
        } else if (a == "--threads" && i + 1 < argc) {
            threads_override = std::atoi(argv[++i]);
        } else if (a == "--metrics") {
            print_metrics = true;
        } else {
            Usage();
            return 2;
        }
    }

    auto cfg = config_path.empty() ? sixpn::config::Config::Parse("{}") : sixpn::config::Config::LoadFile(config_path);
    if (!cfg.ok()) {
        std::cerr << cfg.status().ToString() << "\n";
        return 2;
    }
    auto loaded = sixpn::config::LoadSettings(cfg.value());
    if (!loaded.ok()) {
        std::cerr << loaded.status().ToString() << "\n";
        return 2;
    }
    auto settings = std::move(loaded).value();

    for (const auto& s : service_args) {
        auto svc = sixpn::discovery::ParseService(s);
        if (!svc.ok()) {
            std::cerr << svc.status().ToString() << "\n";
            return 2;
        }
        settings.services.push_back(std::move(svc).value());
    }
    if (!dns_override.empty()) {
        settings.dns_server = dns_override;
    }
    if (!log_override.empty()) {
        settings.log_level = log_override;
    }
    if (threads_override >= 0) {
        settings.io_threads = static_cast<std::size_t>(threads_override);
    }
    if (settings.services.empty()) {
        Usage();
        return 2;
    }

    sixpn::dns::DnsClientOptions dns_opt;
    dns_opt.query_timeout = settings.dns_timeout;
    if (settings.dns_server.empty()) {
        dns_opt.server = sixpn::dns::DefaultNameserver();
    } else {
        auto ep = sixpn::dns::ParseNameserver(settings.dns_server, settings.dns_port);
        if (!ep.ok()) {
            std::cerr << ep.status().ToString() << "\n";
            return 2;
        }
        dns_opt.server = ep.value();
    }

    sixpn::AppOptions opt;
    opt.io_threads = settings.io_threads;
    opt.log_level = settings.log_level;
    sixpn::App app(opt);

    auto& ioc = app.Io().context();
    auto client = std::make_shared<sixpn::dns::LiveDnsClient>(ioc, dns_opt, sixpn::log::Get());
    auto engine = sixpn::discovery::DiscoveryEngine::Create(ioc, client, settings.discovery);

    app.AddComponent(std::make_shared<Watcher>(app, engine, settings.services, print_metrics));

    sixpn::log::info("Using nameserver {}, watching {} service(s). Press Ctrl+C to stop.",
                     dns_opt.server.address().to_string(), settings.services.size());
    return app.Run();
}
