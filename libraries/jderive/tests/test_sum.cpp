#include "test_util.hpp"

using namespace jderive;

namespace shapes
{
   struct Shape
   {
      virtual ~Shape() = default;
   };

   struct Circle : Shape
   {
      explicit Circle(double radius) : radius(radius) {}
      double radius;
   };

   struct Square : Shape
   {
      explicit Square(double side) : side(side) {}
      double side;
   };

   // Derives from Shape without being one of its declared alternatives
   struct Hexagon : Shape
   {
   };

   JDERIVE_REFLECT_SUM(Shape, Circle, Square)
   JDERIVE_REFLECT(Circle, base(Shape), radius)
   JDERIVE_REFLECT(Square, base(Shape), side)
   JDERIVE_KEY(Square, "Sq")
}  // namespace shapes

namespace ast
{
   struct Expr
   {
      virtual ~Expr() = default;
   };

   struct Literal : Expr
   {
      explicit Literal(std::int64_t value) : value(value) {}
      std::int64_t value;
   };

   struct Unary : Expr
   {
   };

   struct Neg : Unary
   {
      explicit Neg(std::unique_ptr<Expr> operand) : operand(std::move(operand)) {}
      std::unique_ptr<Expr> operand;
   };

   struct Not : Unary
   {
      explicit Not(std::unique_ptr<Expr> operand) : operand(std::move(operand)) {}
      std::unique_ptr<Expr> operand;
   };

   JDERIVE_REFLECT_SUM(Expr, Literal, Unary)
   JDERIVE_REFLECT(Literal, base(Expr), value)
   JDERIVE_REFLECT_SUM(Unary, base(Expr), Neg, Not)
   JDERIVE_REFLECT(Neg, base(Unary), operand)
   JDERIVE_REFLECT(Not, base(Unary), operand)
   JDERIVE_KEY(Not, "!")
}  // namespace ast

namespace tokens
{
   struct Token
   {
      virtual ~Token() = default;
   };

   struct Eof : Token
   {
   };

   struct Word : Token
   {
      explicit Word(std::string text) : text(std::move(text)) {}
      std::string text;
   };

   struct Nothing
   {
   };

   JDERIVE_REFLECT_SUM(Token, Eof, Word)
   JDERIVE_REFLECT_SINGLETON(Eof, base(Token))
   JDERIVE_REFLECT(Word, base(Token), text)
   JDERIVE_KEY(Eof, "EOF")
   JDERIVE_REFLECT_SINGLETON(Nothing)
}  // namespace tokens

namespace quoting
{
   struct Node
   {
      virtual ~Node() = default;
   };

   struct Odd : Node
   {
   };

   JDERIVE_REFLECT_SUM(Node, Odd)
   JDERIVE_REFLECT_SINGLETON(Odd, base(Node))
   JDERIVE_KEY(Odd, "say \"hi\"\\\n")
}  // namespace quoting

namespace generic
{
   struct Parcel
   {
      virtual ~Parcel() = default;
   };

   template <typename T>
   struct Boxed : Parcel
   {
      explicit Boxed(T item) : item(std::move(item)) {}
      T item;
   };

   JDERIVE_REFLECT_SUM(Parcel, Boxed<std::int32_t>, Boxed<std::string>)
   JDERIVE_REFLECT(template(typename) Boxed, base(Parcel), item)
}  // namespace generic

namespace layers
{
   struct Root
   {
      virtual ~Root() = default;
   };

   // Not a sum itself, but its subclasses are still alternatives of Root
   struct Middle : Root
   {
      explicit Middle(std::int32_t depth) : depth(depth) {}
      std::int32_t depth;
   };

   struct Leaf : Middle
   {
      explicit Leaf(std::string note) : Middle(0), note(std::move(note)) {}
      std::string note;
   };

   JDERIVE_REFLECT_SUM(Root, Middle)
   JDERIVE_REFLECT(Middle, base(Root), depth)
   JDERIVE_REFLECT(Leaf, base(Middle), note)
}  // namespace layers

TEST_CASE("sum write tags the alternative")
{
   shapes::Circle circle{3};
   shapes::Square square{2};
   CHECK(convert_to_json<shapes::Shape>(circle) == R"({"shapes::Circle":{"radius":3}})");
   CHECK(convert_to_json<shapes::Shape>(square) == R"({"Sq":{"side":2}})");

   // An alternative on its own carries its tag too
   CHECK(convert_to_json(circle) == R"({"shapes::Circle":{"radius":3}})");
}

TEST_CASE("sum read dispatches on the tag")
{
   auto circle = convert_from_json<shapes::Shape>(R"({"shapes::Circle":{"radius":3}})");
   REQUIRE(dynamic_cast<shapes::Circle*>(circle.get()) != nullptr);
   CHECK(dynamic_cast<shapes::Circle&>(*circle).radius == 3);

   auto square = convert_from_json<shapes::Shape>(R"({"Sq":{"side":2}})");
   REQUIRE(dynamic_cast<shapes::Square*>(square.get()) != nullptr);
   CHECK(dynamic_cast<shapes::Square&>(*square).side == 2);

   CHECK(convert_from_json<shapes::Circle>(R"({"shapes::Circle":{"radius":1.5}})").radius == 1.5);
}

TEST_CASE("sum read errors")
{
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>(R"({"Triangle":{"a":1}})"),
                        conversion_error, has_code(conversion_errc::unknown_variant, "Triangle"));
   // tags are matched exactly
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>(R"({"sq":{"side":2}})"),
                        conversion_error, has_code(conversion_errc::unknown_variant, "sq"));
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>(R"({"radius":3,"x":1})"),
                        conversion_error, has_code(conversion_errc::expected_tagged));
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>(R"({})"), conversion_error,
                        has_code(conversion_errc::expected_tagged));
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>("[]"), conversion_error,
                        has_code(conversion_errc::expected_tagged));
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Circle>(R"({"Sq":{"radius":3}})"),
                        conversion_error, has_code(conversion_errc::unknown_variant, "Sq"));
}

TEST_CASE("renamed alternatives are not read under their type name")
{
   CHECK_THROWS_MATCHES(convert_from_json<shapes::Shape>(R"({"shapes::Square":{"side":2}})"),
                        conversion_error,
                        has_code(conversion_errc::unknown_variant, "shapes::Square"));
   CHECK_THROWS_MATCHES(convert_from_json<tokens::Token>(R"({"tokens::Eof":{}})"),
                        conversion_error,
                        has_code(conversion_errc::unknown_variant, "tokens::Eof"));
}

TEST_CASE("sums behind shared pointers")
{
   auto shape = convert_from_json<std::shared_ptr<shapes::Shape>>(R"({"Sq":{"side":4}})");
   REQUIRE(std::dynamic_pointer_cast<shapes::Square>(shape) != nullptr);
   CHECK(std::dynamic_pointer_cast<shapes::Square>(shape)->side == 4);
   CHECK(convert_to_json(shape) == R"({"Sq":{"side":4}})");
   CHECK(convert_from_json<std::shared_ptr<shapes::Shape>>("null") == nullptr);
}

TEST_CASE("class templates as alternatives")
{
   generic::Boxed<std::int32_t> number{7};
   CHECK(convert_to_json<generic::Parcel>(number) == R"({"generic::Boxed<int32>":{"item":7}})");

   auto parcel =
       convert_from_json<generic::Parcel>(R"({"generic::Boxed<string>":{"item":"x"}})");
   auto* boxed = dynamic_cast<generic::Boxed<std::string>*>(parcel.get());
   REQUIRE(boxed != nullptr);
   CHECK(boxed->item == "x");

   CHECK(classify<generic::Parcel>().variants ==
         std::vector<std::string>{"generic::Boxed<int32>", "generic::Boxed<string>"});
   CHECK(classify<generic::Boxed<std::string>>().tag == "generic::Boxed<string>");
}

TEST_CASE("sum ancestry is transitive")
{
   CHECK(has_sum_ancestor<layers::Middle>());
   CHECK(has_sum_ancestor<layers::Leaf>());
   CHECK(!has_sum_ancestor<layers::Root>());
   CHECK(classify<layers::Leaf>().tag == "layers::Leaf");
   CHECK(classify<layers::Middle>().tag == "layers::Middle");
}

TEST_CASE("sum bases need a virtual destructor")
{
   struct Plain
   {
   };
   struct Virtual
   {
      virtual void f() {}
   };
   STATIC_REQUIRE(!is_sum_base<Plain>);
   STATIC_REQUIRE(!is_sum_base<Virtual>);
   STATIC_REQUIRE(is_sum_base<shapes::Shape>);
   STATIC_REQUIRE(is_sum_base<generic::Parcel>);
}

TEST_CASE("sum write rejects undeclared alternatives")
{
   shapes::Hexagon hexagon;
   CHECK_THROWS_MATCHES(convert_to_json<shapes::Shape>(hexagon), conversion_error,
                        has_code(conversion_errc::unknown_variant, "shapes::Hexagon"));
}

TEST_CASE("nested sums")
{
   auto neg = std::make_unique<ast::Neg>(std::make_unique<ast::Literal>(5));
   std::string json = R"({"ast::Neg":{"operand":{"ast::Literal":{"value":5}}}})";
   CHECK(convert_to_json<ast::Expr>(*neg) == json);
   CHECK(convert_to_json<ast::Unary>(*neg) == json);

   auto expr = convert_from_json<ast::Expr>(json);
   auto* n   = dynamic_cast<ast::Neg*>(expr.get());
   REQUIRE(n != nullptr);
   auto* lit = dynamic_cast<ast::Literal*>(n->operand.get());
   REQUIRE(lit != nullptr);
   CHECK(lit->value == 5);
   CHECK(convert_to_json<ast::Expr>(*expr) == json);

   std::string deep = R"({"!":{"operand":{"ast::Neg":{"operand":{"ast::Literal":{"value":-7}}}}}})";
   CHECK(convert_to_json<ast::Expr>(*convert_from_json<ast::Expr>(deep)) == deep);

   auto unary = convert_from_json<ast::Unary>(R"({"!":{"operand":null}})");
   REQUIRE(dynamic_cast<ast::Not*>(unary.get()) != nullptr);
   CHECK(dynamic_cast<ast::Not&>(*unary).operand == nullptr);

   // Literal is an alternative of Expr but not of Unary
   CHECK_THROWS_MATCHES(convert_from_json<ast::Unary>(R"({"ast::Literal":{"value":1}})"),
                        conversion_error,
                        has_code(conversion_errc::unknown_variant, "ast::Literal"));
}

TEST_CASE("singletons")
{
   tokens::Eof eof;
   CHECK(convert_to_json<tokens::Token>(eof) == R"({"EOF":{}})");
   CHECK(convert_to_json<tokens::Token>(tokens::Word{"hi"}) == R"({"tokens::Word":{"text":"hi"}})");

   auto token = convert_from_json<tokens::Token>(R"({"EOF":{}})");
   CHECK(dynamic_cast<tokens::Eof*>(token.get()) != nullptr);
   CHECK(dynamic_cast<tokens::Eof*>(convert_from_json<tokens::Token>(R"({"EOF":null})").get()) !=
         nullptr);

   CHECK(convert_to_json(tokens::Nothing{}) == "{}");
   CHECK_NOTHROW(convert_from_json<tokens::Nothing>("{}"));
   CHECK_NOTHROW(convert_from_json<tokens::Nothing>("42"));
}

TEST_CASE("tags survive the text codec")
{
   quoting::Odd odd;
   auto         json = convert_to_json<quoting::Node>(odd);
   CHECK(json == R"({"say \"hi\"\\\n":{}})");
   CHECK(peek_tag(parse_json(json)) == "say \"hi\"\\\n");
   CHECK(dynamic_cast<quoting::Odd*>(convert_from_json<quoting::Node>(json).get()) != nullptr);
}

TEST_CASE("variant enumeration")
{
   derivation_session session;
   auto               entries = enumerate_variants<ast::Expr>(session);
   REQUIRE(entries.size() == 2);
   CHECK(entries[0].name == "ast::Literal");
   CHECK(entries[0].tags == std::vector<std::string>{"ast::Literal"});
   CHECK(entries[1].name == "ast::Unary");
   CHECK(entries[1].tags == std::vector<std::string>{"ast::Neg", "!"});

   auto shape = classify<ast::Unary>();
   CHECK(shape.kind == shape_kind::sum);
   CHECK(shape.variants == std::vector<std::string>{"ast::Neg", "ast::Not"});
   CHECK(shape.tag == "ast::Unary");
   CHECK(classify<tokens::Eof>().kind == shape_kind::singleton);
   CHECK(classify<tokens::Eof>().tag == "EOF");
}

TEST_CASE("default tags are the qualified type name")
{
   CHECK(tag_of<shapes::Circle>() == "shapes::Circle");
   CHECK(tag_of<ast::Neg>() == "ast::Neg");
   CHECK(tag_of<shapes::Square>() == "Sq");
   CHECK(tag_of<generic::Boxed<std::int32_t>>() == "generic::Boxed<int32>");
}
