#include <chtest.hpp>

#include <sixpn/core/status.h>
#include <sixpn/discovery/service.h>

#include <unordered_set>

using sixpn::Status;
using sixpn::StatusCode;
using sixpn::discovery::Instance;
using sixpn::discovery::ParseService;
using sixpn::discovery::ParseServiceList;
using sixpn::discovery::Service;
using sixpn::discovery::ServiceHash;

TEST_CASE("Service identity ignores the nearest hint") {
    REQUIRE(Service("web", 80, 1) == Service("web", 80, 5));
    REQUIRE(Service("web", 80) != Service("web", 81));
    REQUIRE(Service("web", 80) != Service("api", 80));

    std::unordered_set<Service, ServiceHash> set;
    set.insert(Service("web", 80, 1));
    set.insert(Service("web", 80, 2));
    REQUIRE(set.size() == 1);
}

TEST_CASE("Instances format IPv6 hosts in brackets") {
    REQUIRE(Instance{"fdaa::1", 80}.ToString() == "[fdaa::1]:80");
    REQUIRE(Instance{"10.0.0.1", 80}.ToString() == "10.0.0.1:80");
    REQUIRE(sixpn::discovery::ToString({Instance{"a", 1}, Instance{"b", 2}}) == "[a:1, b:2]");
    REQUIRE(Service("web", 8080).ToString() == "web:8080");
}

TEST_CASE("ParseService reads name, port and optional nearest count") {
    auto s = ParseService(" web:8080 ");
    REQUIRE(s.ok());
    REQUIRE(s.value().app_name == "web");
    REQUIRE(s.value().port == 8080);
    REQUIRE(s.value().nearest == 1);

    REQUIRE(ParseService("db:5432:3").value().nearest == 3);

    REQUIRE(ParseService("web").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseService(":80").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseService("web:0").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseService("web:65536").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseService("web:80:0").status().code() == StatusCode::invalid_argument);
    REQUIRE(ParseService("web:80x").status().code() == StatusCode::invalid_argument);
}

TEST_CASE("ParseServiceList skips blank entries and stops at the first bad one") {
    auto list = ParseServiceList("web:80,, db:5432:2 ,");
    REQUIRE(list.ok());
    REQUIRE(list.value().size() == 2);
    REQUIRE(list.value()[1] == Service("db", 5432));

    REQUIRE(ParseServiceList("").value().empty());
    REQUIRE(!ParseServiceList("web:80,bad").ok());
}

TEST_CASE("Status formats code, message and details") {
    Status st(StatusCode::not_found, "could not find services", {"cache", "queue"});
    REQUIRE(!st.ok());
    REQUIRE(st.ToString() == "not_found: could not find services [cache, queue]");
    REQUIRE(Status::Ok().ok());
    REQUIRE(sixpn::ToString(StatusCode::unknown_service) == "unknown_service");
}
