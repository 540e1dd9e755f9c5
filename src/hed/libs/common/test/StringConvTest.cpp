#include <cppunit/extensions/HelperMacros.h>

#include <aeat/StringConv.h>

class StringConvTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(StringConvTest);
  CPPUNIT_TEST(TestStringConv);
  CPPUNIT_TEST(TestIntegers);
  CPPUNIT_TEST_SUITE_END();

public:
  void TestStringConv();
  void TestIntegers();
};

void StringConvTest::TestStringConv() {

  std::string in;
  std::string out;

  in = "aBcDeFgHiJkLmN";
  out = Aeat::lower(in);
  CPPUNIT_ASSERT_EQUAL(std::string("abcdefghijklmn"), out);
  out = Aeat::upper(in);
  CPPUNIT_ASSERT_EQUAL(std::string("ABCDEFGHIJKLMN"), out);

  in = "####0123456789++++";
  out = Aeat::trim(in,"#+");
  CPPUNIT_ASSERT_EQUAL(std::string("0123456789"), out);

  in = " \t produccion\r\n";
  CPPUNIT_ASSERT_EQUAL(std::string("produccion"), Aeat::trim(in));
  CPPUNIT_ASSERT_EQUAL(std::string(""), Aeat::trim(" \n "));
}

void StringConvTest::TestIntegers() {
  int n = 0;

  CPPUNIT_ASSERT_EQUAL(std::string("12345"), Aeat::tostring(12345));
  CPPUNIT_ASSERT_EQUAL(std::string("  42"), Aeat::tostring(42, 4));

  CPPUNIT_ASSERT(Aeat::stringto("60", n));
  CPPUNIT_ASSERT_EQUAL(60, n);
  CPPUNIT_ASSERT(!Aeat::stringto("", n));
  CPPUNIT_ASSERT(!Aeat::stringto("10s", n));
  CPPUNIT_ASSERT(!Aeat::stringto("ten", n));

  CPPUNIT_ASSERT(Aeat::strtoint("12345",n));
  CPPUNIT_ASSERT_EQUAL(12345,n);
  CPPUNIT_ASSERT(Aeat::strtoint("1f",n,16));
  CPPUNIT_ASSERT_EQUAL(31,n);
  CPPUNIT_ASSERT(!Aeat::strtoint("99999999999",n));
  CPPUNIT_ASSERT(!Aeat::strtoint("12",n,1));
}

CPPUNIT_TEST_SUITE_REGISTRATION(StringConvTest);
