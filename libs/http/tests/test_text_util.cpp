#include "kj/test.h"
#include "rio/http/text_util.h"

using namespace rio::http;

namespace {

KJ_TEST("trim strips spaces and tabs only") {
  KJ_EXPECT(trim("  gzip\t"_kj) == "gzip"_kj);
  KJ_EXPECT(trim("a b"_kj) == "a b"_kj);
  KJ_EXPECT(trim(" \t "_kj) == ""_kj);
  KJ_EXPECT(trim("x\r\n"_kj) == "x\r\n"_kj);
}

KJ_TEST("case helpers are ASCII only") {
  KJ_EXPECT(lowercase("Text/HTML"_kj) == "text/html"_kj);
  KJ_EXPECT(uppercase("post"_kj) == "POST"_kj);
  KJ_EXPECT(equals_ignore_case("Accept-Encoding"_kj, "accept-encoding"_kj));
  KJ_EXPECT(!equals_ignore_case("gzip"_kj, "gzip2"_kj));
  KJ_EXPECT(!equals_ignore_case("a"_kj, "b"_kj));
}

KJ_TEST("split keeps empty pieces") {
  auto pieces = split("a;;b"_kj, ';');
  KJ_ASSERT(pieces.size() == 3);
  KJ_EXPECT(pieces[0] == "a"_kj);
  KJ_EXPECT(pieces[1] == ""_kj);
  KJ_EXPECT(pieces[2] == "b"_kj);

  KJ_EXPECT(split(""_kj, ',').size() == 1);
}

KJ_TEST("split_list trims items and drops blanks") {
  auto items = split_list("a, b,,c "_kj);
  KJ_ASSERT(items.size() == 3);
  KJ_EXPECT(items[0] == "a"_kj);
  KJ_EXPECT(items[1] == "b"_kj);
  KJ_EXPECT(items[2] == "c"_kj);

  KJ_EXPECT(split_list(" , "_kj).size() == 0);
}

} // namespace
