#include <sixpn/core/metrics.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace sixpn {
namespace {

void AppendEscaped(std::ostringstream& oss, std::string_view value) {
    for (char c : value) {
        if (c == '\\' || c == '"') {
            oss << '\\' << c;
        } else if (c == '\n') {
            oss << "\\n";
        } else {
            oss << c;
        }
    }
}

} // namespace

std::string FormatLabels(const MetricLabels& labels) {
    if (labels.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << key << "=\"";
        AppendEscaped(oss, value);
        oss << "\"";
    }
    oss << "}";
    return oss.str();
}

Histogram::Histogram(std::vector<double> bounds)
    : bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size(), 0);
}

void Histogram::Observe(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    sum_ += v;
    ++count_;

    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), v);
    if (it != bounds_.end()) {
        ++counts_[static_cast<std::size_t>(it - bounds_.begin())];
    }
}

Histogram::Snapshot Histogram::Take() const {
    std::lock_guard<std::mutex> lk(mu_);
    return Snapshot{bounds_, counts_, sum_, count_};
}

MetricsRegistry::Family& MetricsRegistry::FamilyLocked(std::string_view name, std::string_view help, Kind kind) {
    auto it = families_.find(name);
    if (it == families_.end()) {
        Family family;
        family.kind = kind;
        family.help = std::string(help);
        it = families_.emplace(std::string(name), std::move(family)).first;
    } else if (it->second.kind != kind) {
        throw std::invalid_argument("metric '" + std::string(name) + "' registered with a different type");
    }
    return it->second;
}

Counter& MetricsRegistry::GetCounter(std::string_view name, std::string_view help, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& family = FamilyLocked(name, help, Kind::counter);
    auto& slot = family.counters[labels];
    if (!slot) {
        slot = std::make_unique<Counter>();
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(std::string_view name, std::string_view help, std::vector<double> bounds,
                                         const MetricLabels& labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& family = FamilyLocked(name, help, Kind::histogram);
    auto& slot = family.histograms[labels];
    if (!slot) {
        slot = std::make_unique<Histogram>(std::move(bounds));
    }
    return *slot;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    for (const auto& [name, family] : families_) {
        oss << "# HELP " << name << " " << family.help << "\n";

        if (family.kind == Kind::counter) {
            oss << "# TYPE " << name << " counter\n";
            for (const auto& [labels, counter] : family.counters) {
                oss << name << FormatLabels(labels) << " " << counter->Value() << "\n";
            }
            continue;
        }

        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [labels, histogram] : family.histograms) {
            auto snap = histogram->Take();
            std::uint64_t cumulative = 0;
            for (std::size_t i = 0; i < snap.bounds.size(); ++i) {
                cumulative += snap.counts[i];
                auto bucket_labels = labels;
                bucket_labels["le"] = std::to_string(snap.bounds[i]);
                oss << name << "_bucket" << FormatLabels(bucket_labels) << " " << cumulative << "\n";
            }
            auto inf_labels = labels;
            inf_labels["le"] = "+Inf";
            oss << name << "_bucket" << FormatLabels(inf_labels) << " " << snap.count << "\n";
            oss << name << "_sum" << FormatLabels(labels) << " " << snap.sum << "\n";
            oss << name << "_count" << FormatLabels(labels) << " " << snap.count << "\n";
        }
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace sixpn
