#include "AttributeCombinator.h"

#include <doctest/doctest.h>

namespace {

ProductAttribute attribute(const QString &name, const QStringList &values) {
  ProductAttribute a;
  a.name = name;
  a.values = values;
  return a;
}

QStringList valuesOf(const AttributeCombination &combination) {
  QStringList values;
  for (const auto &pair : combination) values << pair.second;
  return values;
}

}  // namespace

TEST_CASE("AttributeCombinator turns the last attribute fastest") {
  AttributeCombinator combinator({attribute("size", {"S", "M"}), attribute("colour", {"red", "blue", "green"})});
  CHECK(combinator.total() == 6);

  const QVector<AttributeCombination> all = combinator.all();
  REQUIRE(all.size() == 6);
  CHECK(valuesOf(all[0]) == QStringList({"S", "red"}));
  CHECK(valuesOf(all[1]) == QStringList({"S", "blue"}));
  CHECK(valuesOf(all[2]) == QStringList({"S", "green"}));
  CHECK(valuesOf(all[3]) == QStringList({"M", "red"}));
  CHECK(valuesOf(all[5]) == QStringList({"M", "green"}));
  CHECK(all[0][0].first == QString("size"));
  CHECK(all[0][1].first == QString("colour"));
}

TEST_CASE("AttributeCombinator stops at its bound") {
  const QStringList digits = {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"};
  AttributeCombinator combinator({attribute("a", digits), attribute("b", digits), attribute("c", digits)}, 25);
  CHECK(combinator.total() == 25);

  int produced = 0;
  AttributeCombination last;
  while (combinator.hasNext()) {
    last = combinator.next();
    ++produced;
  }
  CHECK(produced == 25);
  CHECK(valuesOf(last) == QStringList({"0", "2", "4"}));
}

TEST_CASE("AttributeCombinator restarts from the first combination") {
  AttributeCombinator combinator({attribute("size", {"S", "M"})});
  CHECK(valuesOf(combinator.next()) == QStringList({"S"}));
  CHECK(valuesOf(combinator.next()) == QStringList({"M"}));
  CHECK(!combinator.hasNext());
  CHECK(combinator.next().isEmpty());

  combinator.reset();
  CHECK(combinator.hasNext());
  CHECK(valuesOf(combinator.next()) == QStringList({"S"}));
}

TEST_CASE("AttributeCombinator yields nothing without values") {
  AttributeCombinator none((QVector<ProductAttribute>()));
  CHECK(none.total() == 0);
  CHECK(!none.hasNext());

  AttributeCombinator emptyValue({attribute("size", {"S", "M"}), attribute("colour", {})});
  CHECK(emptyValue.total() == 0);
  CHECK(emptyValue.all().isEmpty());
}
