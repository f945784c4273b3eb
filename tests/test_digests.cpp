#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "idlecore/core/content.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/util/digest.h"
#include "idlecore/util/json.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_digests() {
  using namespace idlecore;

  // --- FNV-1a reference values ---
  IC_ASSERT(fnv1a32("") == 0x811c9dc5u);
  IC_ASSERT(fnv1a32("hello") == 0x4f9f2cabu);
  IC_ASSERT(digest32_to_hex(0x4f9f2cabu) == "4f9f2cab");
  IC_ASSERT(digest32_to_hex(0x1u) == "00000001");
  IC_ASSERT(parse_digest32("4f9f2cab") == 0x4f9f2cabu);
  IC_ASSERT(parse_digest32("fnv1a-4F9F2CAB") == 0x4f9f2cabu);
  {
    bool threw = false;
    try {
      (void)parse_digest32("xyz");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Id lists are separator-aware and order-sensitive ---
  IC_ASSERT(fnv1a32_ids({"ab", "c"}) != fnv1a32_ids({"a", "bc"}));
  IC_ASSERT(fnv1a32_ids({"energy", "crystal"}) != fnv1a32_ids({"crystal", "energy"}));
  IC_ASSERT(fnv1a32_ids({"energy"}) == fnv1a32_ids({"energy"}));

  // --- Resource digests ---
  const ResourceDigest d = compute_resource_digest({"energy", "crystal"});
  IC_ASSERT(d.version == 2);
  IC_ASSERT(d.hash.size() == 14);
  IC_ASSERT(d.hash.rfind("fnv1a-", 0) == 0);
  IC_ASSERT(d.hash == "fnv1a-" + digest32_to_hex(fnv1a32_ids({"energy", "crystal"})));
  IC_ASSERT(compute_resource_digest({}).version == 0);

  const ResourceDigest back = resource_digest_from_json(resource_digest_to_json(d));
  IC_ASSERT(back == d);
  IC_ASSERT(back.ids == d.ids);

  // A digest whose hash disagrees with its ids is rejected.
  {
    json::Value tampered = resource_digest_to_json(d);
    (*tampered.as_object())["version"] = 3.0;
    bool threw = false;
    try {
      (void)resource_digest_from_json(tampered);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }
  {
    json::Value tampered = resource_digest_to_json(d);
    (*tampered.as_object())["hash"] = std::string("fnv1a-00000000");
    bool threw = false;
    try {
      (void)resource_digest_from_json(tampered);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Pack digests depend on resource order only, not on JSON layout ---
  {
    const char* a = R"({"id": "p", "version": "1.0.0",
      "resources": [{"id": "ore", "startAmount": 5, "unlocked": true}, {"id": "bar", "capacity": 10}]})";
    const char* b = R"({"resources": [{"unlocked": true, "startAmount": 5, "id": "ore"}, {"capacity": 10, "id": "bar"}],
      "version": "1.0.0", "id": "p"})";
    const ContentPack pa = content_pack_from_json(json::parse(a));
    const ContentPack pb = content_pack_from_json(json::parse(b));
    IC_ASSERT(pa.digest() == pb.digest());
    IC_ASSERT(pa.digest().ids == pb.digest().ids);

    const json::Value once = json::parse(json::stringify(json::parse(b), 2));
    const ContentPack pc = content_pack_from_json(json::parse(json::stringify(once, 0)));
    IC_ASSERT(pc.digest() == pa.digest());
    IC_ASSERT(json::stringify(json::parse(a), 0) == json::stringify(json::parse(b), 0));

    const ContentPack swapped = content_pack_from_json(json::parse(
        R"({"id": "p", "resources": [{"id": "bar", "capacity": 10}, {"id": "ore", "startAmount": 5, "unlocked": true}]})"));
    IC_ASSERT(swapped.digest() != pa.digest());
  }

  return 0;
}
