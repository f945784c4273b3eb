#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "idlecore/util/json.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_json() {
  using namespace idlecore;

  const json::Value v = json::parse(R"({"b": 1, "a": [true, null, "x"], "c": 1.5})");
  IC_ASSERT(v.is_object());
  IC_ASSERT(v.at("b").int_value() == 1);
  IC_ASSERT(v.at("a").array().size() == 3);
  IC_ASSERT(v.at("a").at(0).bool_value() == true);
  IC_ASSERT(v.at("a").at(1).is_null());
  IC_ASSERT(v.at("a").at(2).string_value() == "x");
  IC_ASSERT(v.find("missing") == nullptr);
  IC_ASSERT(v.at("b").find("anything") == nullptr);
  IC_ASSERT(json::Value(1e300).int_value() == std::numeric_limits<std::int64_t>::max());
  IC_ASSERT(json::Value(-1e300).int_value() == std::numeric_limits<std::int64_t>::min());

  // Canonical output: sorted keys, integral numbers without a fraction.
  IC_ASSERT(json::stringify(v, 0) == R"({"a":[true,null,"x"],"b":1,"c":1.5})");

  // Indented output parses back to the same canonical text.
  IC_ASSERT(json::stringify(json::parse(json::stringify(v, 2)), 0) == json::stringify(v, 0));

  // Doubles survive a text round trip exactly.
  const double tricky = 0.1 + 0.2;
  const json::Value back = json::parse(json::stringify(json::Value(tricky), 0));
  IC_ASSERT(back.number_value() == tricky);

  IC_ASSERT(json::stringify(json::Value(std::numeric_limits<double>::infinity()), 0) == "null");
  IC_ASSERT(json::stringify(json::Value(-3.0), 0) == "-3");

  {
    bool threw = false;
    try {
      (void)v.at("nope");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  {
    bool threw = false;
    try {
      (void)json::parse("{\n  \"a\": }");
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("line 2") != std::string::npos;
    }
    IC_ASSERT(threw);
  }

  // Helpers never throw on a type mismatch; they fall back to the default.
  IC_ASSERT(v.at("a").number_value(7.0) == 7.0);
  IC_ASSERT(v.at("c").string_value("dflt") == "dflt");

  json::Object o;
  o["name"] = std::string("energy");
  o["amount"] = 2.0;
  const json::Value built = json::object(std::move(o));
  IC_ASSERT(json::stringify(built, 0) == R"({"amount":2,"name":"energy"})");

  return 0;
}
