/**
 * @file test_store.cpp
 * @brief Tests for the in-memory cluster store and its YAML snapshot reader.
 *
 * Validates:
 *  - Resource upsert/remove keyed by namespace/name
 *  - Endpoint lookup by port number or port name
 *  - Cluster endpoint resolution errors (headless, no ports, unknown service)
 *  - Stream services sorted by port
 *  - Snapshot parsing and its error codes
 */

#include <gtest/gtest.h>
#include <string>

#include "fixtures.hpp"
#include "ngsynth/store/memory_store.hpp"
#include "ngsynth/store/snapshot.hpp"

using namespace ngsynth;
using namespace ngsynth::testing;
using synthesis::LookupErrc;

// --------------------------- Resources ---------------------------------------

/**
 * @test Upsert_Replaces_By_Key
 * @brief A second upsert of ns/name replaces the first; remove reports misses.
 */
TEST(InMemoryStore, Upsert_Replaces_By_Key) {
  store::InMemoryStore store;
  store.upsert_resource(simple("foo", "a.com", "/", "svc1"));
  store.upsert_resource(simple("bar", "b.com", "/", "svc2"));
  store.upsert_resource(simple("foo", "c.com", "/", "svc1"));

  const auto list = store.list_routing_resources();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].key(), "ns1/foo");
  EXPECT_EQ(list[0].rules[0].host, "c.com");

  EXPECT_TRUE(store.remove_resource("ns1/foo"));
  EXPECT_FALSE(store.remove_resource("ns1/foo"));
  EXPECT_EQ(store.resource_count(), 1u);
}

// --------------------------- Endpoints ---------------------------------------

/**
 * @test Endpoints_By_Number_Or_Name
 * @brief Endpoints registered under the port number are found by the port name too.
 */
TEST(InMemoryStore, Endpoints_By_Number_Or_Name) {
  store::InMemoryStore store;
  add_backend(store, "ns1", "svc1", {"10.0.0.1", "10.0.0.2"});

  const auto by_number = store.resolve_endpoints("ns1/svc1", "80");
  const auto by_name = store.resolve_endpoints("ns1/svc1", "http");
  ASSERT_TRUE(by_number.has_value());
  ASSERT_TRUE(by_name.has_value());
  EXPECT_EQ(by_number->size(), 2u);
  EXPECT_EQ(*by_number, *by_name);

  const auto other_port = store.resolve_endpoints("ns1/svc1", "443");
  ASSERT_TRUE(other_port.has_value());
  EXPECT_TRUE(other_port->empty());
}

/**
 * @test Endpoints_Unknown_Service
 * @brief Resolving endpoints of an unknown service is NotFound.
 */
TEST(InMemoryStore, Endpoints_Unknown_Service) {
  const store::InMemoryStore store{config::BackendPolicy{}};
  const auto r = store.resolve_endpoints("ns1/ghost", "80");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, LookupErrc::NotFound);
}

/**
 * @test Cluster_Endpoint_Resolution
 * @brief The cluster IP is returned for a matching port; headless and portless services fail.
 */
TEST(InMemoryStore, Cluster_Endpoint_Resolution) {
  store::InMemoryStore store;
  store.add_service(service("ns1", "svc1"));
  store.add_service(service("ns1", "headless", 80, "None"));
  auto portless = service("ns1", "portless");
  portless.ports.clear();
  store.add_service(portless);

  const auto ep = store.resolve_cluster_endpoint("ns1/svc1", svc_ref("svc1"));
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->address, "10.96.0.10");
  EXPECT_EQ(ep->port, 80);

  model::ServiceRef named{.name = "svc1", .port_name = "http"};
  EXPECT_TRUE(store.resolve_cluster_endpoint("ns1/svc1", named).has_value());

  EXPECT_EQ(store.resolve_cluster_endpoint("ns1/headless", svc_ref("headless")).error().code, LookupErrc::Invalid);
  EXPECT_EQ(store.resolve_cluster_endpoint("ns1/portless", svc_ref("portless")).error().code, LookupErrc::NoPorts);
  EXPECT_EQ(store.resolve_cluster_endpoint("ns1/svc1", svc_ref("svc1", 8443)).error().code, LookupErrc::NoPorts);
  EXPECT_EQ(store.resolve_cluster_endpoint("ns1/ghost", svc_ref("ghost")).error().code, LookupErrc::NotFound);
}

/**
 * @test Stream_Services_Sorted
 * @brief Stream bindings are filtered by protocol and sorted by port; unknown services skipped.
 */
TEST(InMemoryStore, Stream_Services_Sorted) {
  store::InMemoryStore store;
  add_backend(store, "ns1", "dns", {"10.0.0.9"}, 53);
  add_backend(store, "ns1", "db", {"10.0.0.5"}, 5432);
  store.add_stream({model::Protocol::TCP, 9000, "ns1/db", "5432"});
  store.add_stream({model::Protocol::TCP, 2222, "ns1/db", "5432"});
  store.add_stream({model::Protocol::TCP, 3000, "ns1/ghost", "80"});
  store.add_stream({model::Protocol::UDP, 53, "ns1/dns", "53"});

  const auto tcp = store.stream_services(model::Protocol::TCP);
  ASSERT_EQ(tcp.size(), 2u);
  EXPECT_EQ(tcp[0].port, 2222);
  EXPECT_EQ(tcp[1].port, 9000);
  EXPECT_EQ(tcp[0].backend.name, "db");
  EXPECT_EQ(tcp[0].endpoints.size(), 1u);

  const auto udp = store.stream_services(model::Protocol::UDP);
  ASSERT_EQ(udp.size(), 1u);
  EXPECT_EQ(udp[0].backend.protocol, model::Protocol::UDP);
}

// --------------------------- Snapshot ----------------------------------------

/**
 * @test Snapshot_Loads_Cluster_State
 * @brief Services, endpoints, secrets, the default certificate and resources are read.
 */
TEST(Snapshot, Snapshot_Loads_Cluster_State) {
  store::InMemoryStore store;
  const auto count = store::load_snapshot_string(R"(
services:
  - namespace: ns1
    name: svc1
    cluster-ip: 10.96.0.10
    ports: [{name: http, port: 80, target-port: "8080"}]
endpoints:
  - service: ns1/svc1
    port: "80"
    addresses: [{address: 10.0.0.1, port: 8080}]
certificates:
  - secret: ns1/tls
    dns-names: [a.com]
    expires-unix: 4102444800
secrets:
  - namespace: ns1
    name: basic-auth
    data: {auth: "user:hash"}
default-certificate: ns1/tls
resources:
  - namespace: ns1
    name: foo
    annotations: {nginx.ingress.kubernetes.io/ssl-redirect: "false"}
    rules:
      - host: a.com
        paths: [{path: /, type: Exact, service: svc1, port: http}]
      - host: b.com
)", store);
  ASSERT_TRUE(count.has_value()) << count.error().message;
  EXPECT_EQ(*count, 1u);

  const auto list = store.list_routing_resources();
  ASSERT_EQ(list.size(), 1u);
  const auto& res = list[0];
  EXPECT_EQ(res.annotations.at(ann("ssl-redirect")), "false");
  ASSERT_EQ(res.rules.size(), 2u);
  ASSERT_TRUE(res.rules[0].http.has_value());
  const auto& path = res.rules[0].http->paths[0];
  ASSERT_TRUE(path.kind.has_value());
  EXPECT_EQ(*path.kind, model::PathKind::Exact);
  ASSERT_TRUE(path.service.has_value());
  EXPECT_EQ(path.service->port_name, "http");
  EXPECT_FALSE(res.rules[1].http.has_value());

  EXPECT_EQ(store.resolve_endpoints("ns1/svc1", "http")->size(), 1u);
  EXPECT_TRUE(store.get_secret("ns1/basic-auth").has_value());
  ASSERT_TRUE(store.default_certificate().has_value());
  EXPECT_EQ(store.default_certificate()->name, "ns1/tls");
}

/**
 * @test Snapshot_Bad_Path_Type
 * @brief Unknown path types make the snapshot invalid.
 */
TEST(Snapshot, Snapshot_Bad_Path_Type) {
  store::InMemoryStore store;
  const auto r = store::load_snapshot_string(R"(
resources:
  - namespace: ns1
    name: foo
    rules: [{host: a.com, paths: [{path: /, type: Glob, service: svc1, port: 80}]}]
)", store);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, config::ConfigErrc::InvalidValue);
}

/**
 * @test Snapshot_Unlisted_Default_Certificate
 * @brief The default certificate must be one of the listed certificates.
 */
TEST(Snapshot, Snapshot_Unlisted_Default_Certificate) {
  store::InMemoryStore store;
  const auto r = store::load_snapshot_string("default-certificate: ns1/missing\n", store);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, config::ConfigErrc::InvalidValue);
}

/**
 * @test Snapshot_Errors
 * @brief Malformed documents and missing files map to their error codes.
 */
TEST(Snapshot, Snapshot_Errors) {
  store::InMemoryStore store;
  EXPECT_EQ(store::load_snapshot_string("resources: [unclosed\n", store).error().code,
            config::ConfigErrc::ParseError);
  EXPECT_EQ(store::load_snapshot_file("/nonexistent/ngsynth/snapshot.yaml", store).error().code,
            config::ConfigErrc::FileNotFound);
  EXPECT_EQ(*store::load_snapshot_string("", store), 0u);
}
