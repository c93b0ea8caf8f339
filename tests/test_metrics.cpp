#include <chtest.hpp>

#include <sixpn/core/metrics.h>

#include <stdexcept>
#include <string>

using sixpn::MetricsRegistry;

TEST_CASE("Counters are shared per name and labels") {
    MetricsRegistry reg;
    reg.GetCounter("sixpn_lookups_total", "Lookups", {{"outcome", "ok"}}).Inc();
    reg.GetCounter("sixpn_lookups_total", "Lookups", {{"outcome", "ok"}}).Inc(2);
    reg.GetCounter("sixpn_lookups_total", "Lookups", {{"outcome", "timeout"}}).Inc();

    REQUIRE(reg.GetCounter("sixpn_lookups_total", "Lookups", {{"outcome", "ok"}}).Value() == 3);

    auto text = reg.ToPrometheusText();
    REQUIRE(text.find("# TYPE sixpn_lookups_total counter") != std::string::npos);
    REQUIRE(text.find("sixpn_lookups_total{outcome=\"ok\"} 3") != std::string::npos);
    REQUIRE(text.find("sixpn_lookups_total{outcome=\"timeout\"} 1") != std::string::npos);
}

TEST_CASE("Histograms export cumulative buckets") {
    MetricsRegistry reg;
    auto& h = reg.GetHistogram("sixpn_refresh_round_ms", "Round latency", {10, 1, 100});
    h.Observe(0.5);
    h.Observe(5);
    h.Observe(500);

    auto snap = h.Take();
    REQUIRE(snap.bounds.front() == 1);
    REQUIRE(snap.count == 3);

    auto text = reg.ToPrometheusText();
    REQUIRE(text.find("sixpn_refresh_round_ms_bucket{le=\"10.000000\"} 2") != std::string::npos);
    REQUIRE(text.find("sixpn_refresh_round_ms_bucket{le=\"+Inf\"} 3") != std::string::npos);
    REQUIRE(text.find("sixpn_refresh_round_ms_count 3") != std::string::npos);
}

TEST_CASE("A metric name cannot change type") {
    MetricsRegistry reg;
    reg.GetCounter("sixpn_x", "x");
    bool threw = false;
    try {
        reg.GetHistogram("sixpn_x", "x", {1});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    REQUIRE(threw);
}

TEST_CASE("Label values are escaped") {
    REQUIRE(sixpn::FormatLabels({{"a", "x\"y"}, {"b", "1"}}) == "{a=\"x\\\"y\",b=\"1\"}");
    REQUIRE(sixpn::FormatLabels({}).empty());
}
