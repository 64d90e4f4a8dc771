/**
 * @file test_admission.cpp
 * @brief Tests for admission-time validation of routing resources.
 *
 * Validates:
 *  - No-op acceptance: null, deleted and out-of-namespace candidates
 *  - Cluster policy rejections (catch-all, prefix, blocklist, snippets, rate limit)
 *  - Host+path overlap rules, including canary over plain and canary stacking
 *  - Renderer and syntax checker failures reported verbatim
 *  - Metrics: accepted checks, counted errors, timing breakdown
 */

#include <gtest/gtest.h>
#include <string>
#include <utility>

#include "fixtures.hpp"
#include "ngsynth/admission/validator.hpp"
#include "ngsynth/obs/observability.hpp"

using namespace ngsynth;
using namespace ngsynth::testing;
using admission::AdmissionErrc;
using admission::AdmissionValidator;

///
/// Cluster with ns1/foo serving a.com/ and the collaborators a validator needs.
///
struct AdmissionFixture {
  store::InMemoryStore                   store;
  annotations::DefaultAnnotationExtractor extractor{std::string(PREFIX), store};
  FakeRenderer                           renderer;
  FakeChecker                            checker;
  obs::SimpleMetricsSink                 metrics;

  explicit AdmissionFixture(config::BackendPolicy policy = {}) : store(std::move(policy)) {
    add_backend(store, "ns1", "svc1");
    add_backend(store, "ns1", "svc2");
    add_backend(store, "ns1", "svc3");
    store.upsert_resource(extracted(store, simple("foo", "a.com", "/", "svc1")));
  }

  AdmissionValidator validator(config::ControllerConfig controller = {}) {
    return AdmissionValidator(store, store, &store, extractor, renderer, checker, metrics, std::move(controller));
  }
};

static inline model::AnnotationMap canary_on() {
  return {{ann("canary"), "true"}, {ann("canary-weight"), "10"}};
}

// --------------------------- No-op filters -----------------------------------

/**
 * @test Admission_Null_Accepted
 * @brief A missing candidate is a no-op.
 */
TEST(AdmissionValidator, Admission_Null_Accepted) {
  AdmissionFixture fx;
  EXPECT_TRUE(fx.validator().check(nullptr).has_value());
  EXPECT_EQ(fx.renderer.calls, 0);
}

/**
 * @test Admission_Deleted_Accepted
 * @brief A resource being deleted is accepted without synthesis.
 */
TEST(AdmissionValidator, Admission_Deleted_Accepted) {
  AdmissionFixture fx;
  auto bar = simple("bar", "a.com", "/", "svc2");
  bar.deletion_marked = true;

  EXPECT_TRUE(fx.validator().check(&bar).has_value());
  EXPECT_EQ(fx.renderer.calls, 0);
}

/**
 * @test Admission_Other_Namespace_Accepted
 * @brief Resources outside the watched namespace are not validated.
 */
TEST(AdmissionValidator, Admission_Other_Namespace_Accepted) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "a.com", "/", "svc2");

  config::ControllerConfig controller;
  controller.watch_namespace = "ns2";
  EXPECT_TRUE(fx.validator(controller).check(&bar).has_value());
  EXPECT_EQ(fx.renderer.calls, 0);
}

// --------------------------- Overlap -----------------------------------------

/**
 * @test Admission_Duplicate_Host_Path_Conflict
 * @brief A plain resource on a host+path owned by another plain resource is refused.
 */
TEST(AdmissionValidator, Admission_Duplicate_Host_Path_Conflict) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "a.com", "/", "svc2");

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Conflict);
  EXPECT_EQ(r.error().message, "host \"a.com\" and path \"/\" is already defined in routing resource ns1/foo");
  EXPECT_EQ(fx.metrics.counters("ns1/bar").check_errors, 1u);
  EXPECT_EQ(fx.metrics.counters("ns1/bar").checks, 0u);
}

/**
 * @test Admission_Canary_Over_Plain_Accepted
 * @brief A canary may share host+path with a plain resource.
 */
TEST(AdmissionValidator, Admission_Canary_Over_Plain_Accepted) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "a.com", "/", "svc2", canary_on());

  const auto r = fx.validator().check(&bar);

  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(fx.metrics.counters("ns1/bar").checks, 1u);
  EXPECT_EQ(fx.metrics.last_admission().candidate_resources, 2.0);
  EXPECT_EQ(fx.metrics.last_admission().tested_resources, 2.0);
  EXPECT_GT(fx.metrics.last_admission().rendered_bytes, 0.0);
}

/**
 * @test Admission_Disabled_Canary_Over_Plain_Accepted
 * @brief canary "false" is neither a plain resource nor a canary for overlap purposes.
 */
TEST(AdmissionValidator, Admission_Disabled_Canary_Over_Plain_Accepted) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "a.com", "/", "svc2", {{ann("canary"), "false"}});

  EXPECT_TRUE(fx.validator().check(&bar).has_value());
}

/**
 * @test Admission_Canary_Stacking_Conflict
 * @brief A second canary on the same host+path is refused.
 */
TEST(AdmissionValidator, Admission_Canary_Stacking_Conflict) {
  AdmissionFixture fx;
  fx.store.upsert_resource(extracted(fx.store, simple("bar", "a.com", "/", "svc2", canary_on())));
  const auto baz = simple("baz", "a.com", "/", "svc3", canary_on());

  const auto r = fx.validator().check(&baz);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Conflict);
  EXPECT_NE(r.error().message.find("ns1/bar"), std::string::npos);
}

/**
 * @test Admission_Update_Of_Same_Resource_Accepted
 * @brief A new version of an existing resource does not conflict with itself.
 */
TEST(AdmissionValidator, Admission_Update_Of_Same_Resource_Accepted) {
  AdmissionFixture fx;
  const auto foo = simple("foo", "a.com", "/", "svc2");

  const auto r = fx.validator().check(&foo);

  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(fx.metrics.last_admission().candidate_resources, 1.0);
  const auto* server = find_server(fx.renderer.last, "a.com");
  ASSERT_NE(server, nullptr);
  EXPECT_EQ(server->locations[0].backend, "ns1-svc2-80");
}

/**
 * @test Admission_Other_Path_Accepted
 * @brief Different paths on one host do not conflict.
 */
TEST(AdmissionValidator, Admission_Other_Path_Accepted) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "a.com", "/api", "svc2");

  EXPECT_TRUE(fx.validator().check(&bar).has_value());
}

/**
 * @test Check_Overlap_Names_Owner
 * @brief The overlap check alone names the owning resource of the location.
 */
TEST(AdmissionValidator, Check_Overlap_Names_Owner) {
  store::InMemoryStore store;
  add_backend(store, "ns1", "svc1");
  const model::ResourceList resources{simple("foo", "a.com", "/", "svc1"), simple("bar", "a.com", "/", "svc1")};
  const auto result = assemble(store, resources);
  const auto bar = extracted(store, resources[1]);

  const auto r = AdmissionValidator::check_overlap(bar, result.configuration, extracted(store, resources));

  ASSERT_FALSE(r.has_value());
  EXPECT_NE(r.error().message.find("ns1/foo"), std::string::npos);
}

// --------------------------- Policy ------------------------------------------

/**
 * @test Policy_CatchAll_Disabled
 * @brief A default backend is refused when catch-all resources are disabled.
 */
TEST(AdmissionValidator, Policy_CatchAll_Disabled) {
  AdmissionFixture fx;
  auto res = resource("ns1", "catch", {});
  res.default_backend = svc_ref("svc2");

  config::ControllerConfig controller;
  controller.disable_catch_all = true;
  const auto r = fx.validator(controller).check(&res);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
  // policy rejections are not counted
  EXPECT_EQ(fx.metrics.counters("ns1/catch").check_errors, 0u);
}

/**
 * @test Policy_Custom_Prefix
 * @brief The default annotation prefix is refused when a custom one is configured.
 */
TEST(AdmissionValidator, Policy_Custom_Prefix) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "b.com", "/", "svc2", {{ann("rewrite-target"), "/"}});

  config::ControllerConfig controller;
  controller.annotations_prefix = "custom.example.com";
  const auto r = fx.validator(controller).check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
  EXPECT_NE(r.error().message.find("custom.example.com"), std::string::npos);
}

/**
 * @test Policy_Blocklisted_Word
 * @brief Annotation values containing a blocklisted word are refused.
 */
TEST(AdmissionValidator, Policy_Blocklisted_Word) {
  config::BackendPolicy policy;
  policy.annotation_value_word_blocklist = "load_module, ,lua_package";
  AdmissionFixture fx(policy);
  const auto bar = simple("bar", "b.com", "/", "svc2", {{ann("configuration-snippet"), "load_module x.so;"}});

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
  EXPECT_NE(r.error().message.find("load_module"), std::string::npos);
}

/**
 * @test Policy_Snippets_Disabled
 * @brief Snippet annotations are refused when the administrator disabled them.
 */
TEST(AdmissionValidator, Policy_Snippets_Disabled) {
  config::BackendPolicy policy;
  policy.allow_snippet_annotations = false;
  AdmissionFixture fx(policy);
  const auto bar = simple("bar", "b.com", "/", "svc2", {{ann("server-snippet"), "return 200;"}});

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
}

/**
 * @test Policy_Global_Rate_Limit_Needs_Memcached
 * @brief global-rate-limit without a memcached host is refused.
 */
TEST(AdmissionValidator, Policy_Global_Rate_Limit_Needs_Memcached) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "b.com", "/", "svc2", {{ann("global-rate-limit"), "100"}});

  const auto r = fx.validator().check(&bar);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);

  config::BackendPolicy policy;
  policy.global_rate_limit_memcached_host = "memcached.ns1.svc";
  AdmissionFixture with_memcached(policy);
  EXPECT_TRUE(with_memcached.validator().check(&bar).has_value());
}

/**
 * @test Policy_Snippets_Disabled_Any_Prefix
 * @brief Snippet keys are refused whatever their annotation prefix.
 */
TEST(AdmissionValidator, Policy_Snippets_Disabled_Any_Prefix) {
  config::BackendPolicy policy;
  policy.allow_snippet_annotations = false;
  AdmissionFixture fx(policy);
  const auto bar = simple("bar", "b.com", "/", "svc2", {{"example.com/server-snippet", "return 200;"}});

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
  EXPECT_NE(r.error().message.find("example.com/server-snippet"), std::string::npos);
}

/**
 * @test Policy_Global_Rate_Limit_Family_Needs_Memcached
 * @brief Every global-rate-limit-* key is refused without a memcached host.
 */
TEST(AdmissionValidator, Policy_Global_Rate_Limit_Family_Needs_Memcached) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "b.com", "/", "svc2", {{ann("global-rate-limit-window"), "1m"}});

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::Rejected);
  EXPECT_NE(r.error().message.find("global-rate-limit-window"), std::string::npos);
}

// --------------------------- Render / check ----------------------------------

/**
 * @test Admission_Render_Failure_Verbatim
 * @brief Renderer errors are returned as is and counted.
 */
TEST(AdmissionValidator, Admission_Render_Failure_Verbatim) {
  AdmissionFixture fx;
  fx.renderer.failure = "template: unexpected EOF";
  const auto bar = simple("bar", "b.com", "/", "svc2");

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::RenderFailure);
  EXPECT_EQ(r.error().message, "template: unexpected EOF");
  EXPECT_EQ(fx.metrics.counters("ns1/bar").check_errors, 1u);
}

/**
 * @test Admission_Check_Failure_Verbatim
 * @brief Syntax checker errors are returned as is and counted.
 */
TEST(AdmissionValidator, Admission_Check_Failure_Verbatim) {
  AdmissionFixture fx;
  fx.checker.failure = "nginx: [emerg] unknown directive";
  const auto bar = simple("bar", "b.com", "/", "svc2");

  const auto r = fx.validator().check(&bar);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, AdmissionErrc::CheckFailure);
  EXPECT_EQ(r.error().message, "nginx: [emerg] unknown directive");
  EXPECT_EQ(fx.metrics.counters("ns1/bar").check_errors, 1u);
}

/**
 * @test Admission_Default_Path_Kind_Applied
 * @brief Paths without a kind get the controller default before synthesis.
 */
TEST(AdmissionValidator, Admission_Default_Path_Kind_Applied) {
  AdmissionFixture fx;
  const auto bar = resource("ns1", "bar", {http_rule("b.com", {path_rule("/api", "svc2", 80, std::nullopt)})});

  config::ControllerConfig controller;
  controller.default_path_kind = model::PathKind::Exact;
  ASSERT_TRUE(fx.validator(controller).check(&bar).has_value());

  const auto* server = find_server(fx.renderer.last, "b.com");
  ASSERT_NE(server, nullptr);
  EXPECT_NE(find_location(*server, "/api", model::PathKind::Exact), nullptr);
}

/**
 * @test Admission_Reduced_Validation
 * @brief With full validation disabled only the candidate is rendered.
 */
TEST(AdmissionValidator, Admission_Reduced_Validation) {
  AdmissionFixture fx;
  const auto bar = simple("bar", "b.com", "/", "svc2");

  config::ControllerConfig controller;
  controller.disable_full_validation_test = true;
  ASSERT_TRUE(fx.validator(controller).check(&bar).has_value());

  EXPECT_EQ(fx.metrics.last_admission().tested_resources, 1.0);
  EXPECT_EQ(fx.metrics.last_admission().candidate_resources, 2.0);
  EXPECT_EQ(find_server(fx.renderer.last, "a.com"), nullptr);
  EXPECT_NE(find_server(fx.renderer.last, "b.com"), nullptr);
}
