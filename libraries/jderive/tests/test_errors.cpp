#include "test_util.hpp"

using namespace jderive;

namespace bad
{
   struct NumericKey
   {
      std::int32_t a;
   };
   JDERIVE_REFLECT(NumericKey, key(a, 42))

   struct Shape
   {
      virtual ~Shape() = default;
   };
   struct Blob : Shape
   {
   };
   JDERIVE_REFLECT_SUM(Shape, Blob)
   JDERIVE_REFLECT_SINGLETON(Blob, base(Shape))
   JDERIVE_KEY(Blob, nullptr)

   struct SameKey
   {
      std::int32_t a;
      std::int32_t b;
   };
   JDERIVE_REFLECT(SameKey, a, key(b, "a"))

   struct Animal
   {
      virtual ~Animal() = default;
   };
   struct Cat : Animal
   {
   };
   struct Dog : Animal
   {
   };
   JDERIVE_REFLECT_SUM(Animal, Cat, Dog)
   JDERIVE_REFLECT_SINGLETON(Cat, base(Animal))
   JDERIVE_REFLECT_SINGLETON(Dog, base(Animal))
   JDERIVE_KEY(Cat, "pet")
   JDERIVE_KEY(Dog, "pet")

   struct EarlyRest
   {
      std::vector<std::int32_t> rest;
      std::int32_t              last;
   };
   JDERIVE_REFLECT(EarlyRest, variadic(rest), last)

   struct TwoRests
   {
      std::vector<std::int32_t> first;
      std::vector<std::int32_t> second;
   };
   JDERIVE_REFLECT(TwoRests, variadic(first), variadic(second))

   // Only constructible from three values, but reflects two
   struct Triple
   {
      Triple(std::int32_t a, std::int32_t b, std::int32_t c) : a(a), b(b + c) {}
      std::int32_t a;
      std::int32_t b;
   };
   JDERIVE_REFLECT(Triple, a, b)

   // Defaulted fields need a default-constructed instance to take defaults from
   struct NoDefault
   {
      explicit NoDefault(std::int32_t v) : v(v) {}
      std::int32_t v = 1;
   };
   JDERIVE_REFLECT(NoDefault, defaulted(v))

   class Counter
   {
     public:
      explicit Counter(std::int32_t count) : count_(count) {}
      std::int32_t next() { return ++count_; }

     private:
      std::int32_t count_;
   };
   JDERIVE_REFLECT(Counter, next)

   struct Plugin
   {
      virtual ~Plugin() = default;
   };

   struct Lonely
   {
      virtual ~Lonely() = default;
   };
   JDERIVE_REFLECT_SUM(Lonely)
}  // namespace bad

namespace
{
   struct Hidden
   {
      virtual ~Hidden() = default;
   };
   struct Unnamed : Hidden
   {
   };
   JDERIVE_REFLECT_SUM(Hidden, Unnamed)
   JDERIVE_REFLECT_SINGLETON(Unnamed, base(Hidden))

   struct Keyed
   {
      virtual ~Keyed() = default;
   };
   struct Named : Keyed
   {
   };
   JDERIVE_REFLECT_SUM(Keyed, Named)
   JDERIVE_REFLECT_SINGLETON(Named, base(Keyed))
   JDERIVE_KEY(Named, "named")
}  // namespace

TEST_CASE("malformed annotations")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<bad::NumericKey>(), derivation_error,
                        has_code(derivation_errc::malformed_annotation));
   CHECK_THROWS_MATCHES(session.derive<bad::Shape>(), derivation_error,
                        has_code(derivation_errc::malformed_annotation));
   CHECK_THROWS_MATCHES(resolve_name(make_annotation(7), "x", "T::x"), derivation_error,
                        has_code(derivation_errc::malformed_annotation));
   CHECK(resolve_name(make_annotation(), "x", "T::x") == "x");
   CHECK(resolve_name(make_annotation("y"), "x", "T::x") == "y");
}

TEST_CASE("duplicate keys")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<bad::SameKey>(), derivation_error,
                        has_code(derivation_errc::duplicate_key));
   CHECK_THROWS_MATCHES(session.derive<bad::Animal>(), derivation_error,
                        has_code(derivation_errc::duplicate_key));
   // Each alternative on its own is fine
   CHECK(write_json(session, bad::Cat{}) == R"({"pet":{}})");
}

TEST_CASE("misplaced variadic")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<bad::EarlyRest>(), derivation_error,
                        has_code(derivation_errc::misplaced_variadic));
   CHECK_THROWS_MATCHES(session.derive<bad::TwoRests>(), derivation_error,
                        has_code(derivation_errc::misplaced_variadic));
}

TEST_CASE("constructor and deconstructor")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<bad::Triple>(), derivation_error,
                        has_code(derivation_errc::no_constructor));
   CHECK_THROWS_MATCHES(session.derive<bad::NoDefault>(), derivation_error,
                        has_code(derivation_errc::no_constructor));
   CHECK_THROWS_MATCHES(session.derive<bad::Counter>(), derivation_error,
                        has_code(derivation_errc::no_deconstructor));
   CHECK(session.size() == 0);
}

TEST_CASE("open and empty hierarchies")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<bad::Plugin>(), derivation_error,
                        has_code(derivation_errc::not_sealed));
   CHECK_THROWS_MATCHES(session.derive<bad::Lonely>(), derivation_error,
                        has_code(derivation_errc::no_variants));
}

TEST_CASE("alternatives in anonymous namespaces need a key")
{
   derivation_session session;
   CHECK_THROWS_MATCHES(session.derive<Hidden>(), derivation_error,
                        has_code(derivation_errc::anonymous_tag));
   CHECK(session.size() == 0);
   CHECK(write_json(session, std::make_unique<Named>()) == R"({"named":{}})");
}

TEST_CASE("type names are the same on every compiler")
{
   CHECK(portable_type_name("struct shapes::Circle") == "shapes::Circle");
   CHECK(portable_type_name("class ns::Box<struct a::B,class C>") == "ns::Box<a::B,C>");
   CHECK(portable_type_name("ns::Box<int, ns::Pair<int, int> >") ==
         "ns::Box<int,ns::Pair<int,int>>");
   CHECK(portable_type_name("enum palette::Color") == "palette::Color");
   CHECK(portable_type_name("ns::classy") == "ns::classy");
   CHECK(portable_type_name("ns::my_struct ") == "ns::my_struct ");
   CHECK(portable_type_name("unsigned int") == "unsigned int");
   CHECK(template_name("ns::Box<int,ns::Pair<int,int>>") == "ns::Box");
   CHECK(template_name("ns::Outer<int>::Box<char>") == "ns::Outer<int>::Box");
   CHECK(template_name("ns::Plain") == "ns::Plain");
   CHECK(is_anonymous_type_name("(anonymous namespace)::Unnamed"));
   CHECK(is_anonymous_type_name("`anonymous namespace'::Unnamed"));
   CHECK(!is_anonymous_type_name("bad::Shape"));
}

TEST_CASE("derivation errors explain the fix")
{
   try
   {
      derivation_session session;
      session.derive<bad::SameKey>();
      FAIL("derivation should have failed");
   }
   catch (const derivation_error& e)
   {
      CHECK(e.type_name() == "bad::SameKey");
      CHECK(e.detail() == "a");
      CHECK(!e.hint().empty());
      CHECK(std::string(e.what()).find("bad::SameKey") != std::string::npos);
   }
}

TEST_CASE("conversion errors keep their cause")
{
   try
   {
      parse_int<std::uint8_t>("256");
      FAIL("parse should have failed");
   }
   catch (const conversion_error& e)
   {
      CHECK(e.code() == conversion_errc::number_out_of_range);
      CHECK(e.cause() == nullptr);
      CHECK(e.root_cause().code() == conversion_errc::number_out_of_range);
   }

   conversion_error outer{conversion_errc::field_type, "x",
                          std::make_exception_ptr(
                              conversion_error{conversion_errc::expected_string, "inner"})};
   CHECK(outer.root_cause().code() == conversion_errc::expected_string);
   CHECK(outer.root_cause().name() == "inner");
   CHECK(std::string(outer.what()).find("inner") != std::string::npos);

   conversion_error foreign{conversion_errc::invalid_value, "T",
                            std::make_exception_ptr(std::out_of_range("too big"))};
   CHECK(foreign.root_cause().code() == conversion_errc::invalid_value);
   CHECK(std::string(foreign.what()).find("too big") != std::string::npos);
}
