/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <cstring>
#include <string>
#include "literal.h"

using namespace numlit;

static std::string
integer_value (const char *text)
{
  ExactInteger value;

  assert (parseIntegerLiteral (text, value) == opOK);

  return value.toString ();
}

static bool
bad_integer (const char *text)
{
  ExactInteger value (42);

  return (parseIntegerLiteral (text, value) == opSyntaxError
          && value == ExactInteger (42));
}

static bool
bad_float (const char *text)
{
  ExactFloat value;

  return parseFloatLiteral (text, value) == opSyntaxError;
}

/* The float literal TEXT is SIGNIFICAND * BASE^EXPONENT.  */
static bool
float_parts (const char *text, const char *significand,
             exponent_t exponent, unsigned int base)
{
  ExactFloat value;

  if (parseFloatLiteral (text, value) != opOK)
    return false;

  return (value.getSignificand ().toString () == significand
          && value.getExponent () == exponent
          && value.getExponentBase () == base);
}

static std::string
without_separators (const char *text)
{
  std::string result;

  for (; *text; text++)
    if (*text != '_')
      result += *text;

  return result;
}

static void
test_integer_literals (void)
{
  assert (integer_value ("0") == "0");
  assert (integer_value ("1234567890") == "1234567890");
  assert (integer_value ("0b1010") == "10");
  assert (integer_value ("0o17") == "15");
  assert (integer_value ("0xfF") == "255");
  assert (integer_value ("0017") == "17");
  assert (integer_value ("-128") == "-128");
  assert (integer_value ("340282366920938463463374607431768211456")
          == "340282366920938463463374607431768211456");

  /* A negative zero literal is just zero.  */
  {
    ExactInteger zero;

    assert (parseIntegerLiteral ("-0", zero) == opOK);
    assert (zero.isZero () && !zero.isNegative ());
  }

  assert (bad_integer (""));
  assert (bad_integer ("-"));
  assert (bad_integer ("+5"));
  assert (bad_integer ("0x"));
  assert (bad_integer ("0x_ff"));
  assert (bad_integer ("_1"));
  assert (bad_integer ("0B1"));
  assert (bad_integer ("0b102"));
  assert (bad_integer ("0o8"));
  assert (bad_integer ("12a"));
  assert (bad_integer ("1 2"));
  assert (bad_integer ("1.0"));
  assert (bad_integer ("--1"));
}

static void
test_separators (void)
{
  const char *tests[] = {
    "1_000_000",
    "1__0",
    "9_",
    "-3_2_768",
    "0x_",
    "0xdead_beef",
    "0b1111_0000",
    "12345678901234567890_12345678901234567890",
    0
  };
  const char **text;

  for (text = tests; *text; text++)
    {
      ExactInteger with, without;
      opStatus status;

      status = parseIntegerLiteral (*text, with);
      assert (status == parseIntegerLiteral
              (without_separators (*text).c_str (), without));
      if (status == opOK)
        assert (with == without);
    }

  assert (integer_value ("1_000_000") == "1000000");
  assert (integer_value ("0xdead_beef") == "3735928559");
}

static void
test_float_literals (void)
{
  assert (float_parts ("1.5e3", "15", 2, 10));
  assert (float_parts ("12", "12", 0, 10));
  assert (float_parts ("0.001", "1", -3, 10));
  assert (float_parts ("1E-5", "1", -5, 10));
  assert (float_parts ("1_0.2_5e+1_0", "1025", 8, 10));
  assert (float_parts ("0x1.8p-1", "24", -5, 2));
  assert (float_parts ("0xf.fffp-3", "65535", -15, 2));
  assert (float_parts ("0x10P4", "16", 4, 2));

  /* Huge exponents saturate.  */
  assert (float_parts ("1e99999999999999999", "1",
                       ExactFloat::exponentLimit, 10));
  assert (float_parts ("0x1p-99999999999999999", "1",
                       -ExactFloat::exponentLimit, 2));

  {
    ExactFloat value;

    assert (parseFloatLiteral ("-0.0", value) == opOK);
    assert (value.isZero () && value.isNegative ());
  }

  assert (bad_float (".5"));
  assert (bad_float ("5."));
  assert (bad_float ("0x1."));
  assert (bad_float ("0x.1p2"));
  assert (bad_float ("0x1.8"));
  assert (bad_float ("0x1p"));
  assert (bad_float ("0x1p+"));
  assert (bad_float ("1e"));
  assert (bad_float ("1e+"));
  assert (bad_float ("1.e5"));
  assert (bad_float ("1._5"));
  assert (bad_float ("1.5f"));
  assert (bad_float ("0b1.0"));
  assert (bad_float ("inf"));
  assert (bad_float ("nan"));
  assert (bad_float ("+1.0"));
  assert (bad_float (" 1.0"));
}

static void
test_classify (void)
{
  assert (classifyLiteral ("12") == lkInteger);
  assert (classifyLiteral ("0x12") == lkInteger);
  assert (classifyLiteral ("-0") == lkInteger);
  assert (classifyLiteral ("1e5") == lkFloat);
  assert (classifyLiteral ("0x1p5") == lkFloat);
  assert (classifyLiteral ("-0.0") == lkFloat);
  assert (classifyLiteral (".5") == lkInvalid);
  assert (classifyLiteral ("0o1.0") == lkInvalid);
  assert (classifyLiteral ("") == lkInvalid);
}

static void
test_digit_value (void)
{
  assert (digitValue ('7', 8) == 7);
  assert (digitValue ('8', 8) == -1U);
  assert (digitValue ('a', 16) == 10);
  assert (digitValue ('F', 16) == 15);
  assert (digitValue ('g', 16) == -1U);
  assert (digitValue ('a', 10) == -1U);
  assert (digitValue ('_', 16) == -1U);
}

int main (void)
{
  test_integer_literals ();
  test_separators ();
  test_float_literals ();
  test_classify ();
  test_digit_value ();

  return 0;
}
