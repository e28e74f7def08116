/*
   Copyright 2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "binary_float.h"

using namespace numlit;

static const FloatFormat *all_formats[] = {
  &BinaryFloat::ieeeHalf,
  &BinaryFloat::ieeeSingle,
  &BinaryFloat::ieeeDouble,
  &BinaryFloat::x87DoubleExtended,
  &BinaryFloat::ieeeQuad,
};

static bool
prints (const BinaryFloat &value, const char *expected)
{
  return value.toHexString () == expected;
}

static bool
prints (const FloatFormat &format, const char *text, const char *expected)
{
  return prints (BinaryFloat (format, text), expected);
}

/* Reading back what we print gives the same encoding.  */
static bool
reads_back (const BinaryFloat &value)
{
  BinaryFloat tmp (value.getFormat (), BinaryFloat::fcZero, false);
  std::string text (value.toHexString ());
  opStatus status;

  status = tmp.convertFromString (text.c_str ());
  if (status != opOK)
    return false;

  return tmp.bitwiseIsEqual (value);
}

static void
test_expected_text (void)
{
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;

  assert (prints (dbl, "1", "0x1p+0"));
  assert (prints (dbl, "0.75", "0x1.8p-1"));
  assert (prints (dbl, "-2.5", "-0x1.4p+1"));
  assert (prints (dbl, "0.1", "0x1.999999999999ap-4"));
  assert (prints (dbl, "1024", "0x1p+10"));
  assert (prints (BinaryFloat::smallest (dbl), "0x1p-1074"));
  assert (prints (BinaryFloat::smallest (dbl, true), "-0x1p-1074"));
  assert (prints (dbl, "0x1.8p-1073", "0x1.8p-1073"));
  assert (prints (BinaryFloat::largest (dbl), "0x1.fffffffffffffp+1023"));
  assert (prints (dbl, "0", "0x0p+0"));
  assert (prints (dbl, "-0", "-0x0p+0"));
  assert (prints (dbl, "inf", "inf"));
  assert (prints (dbl, "-inf", "-inf"));
  assert (prints (dbl, "nan", "nan"));
  assert (prints (dbl, "-nan(0)", "-nan"));
  assert (prints (dbl, "snan(5)", "snan(0x5)"));
  assert (prints (dbl, "nan(0xABC)", "nan(0xabc)"));

  assert (prints (BinaryFloat::largest (BinaryFloat::ieeeSingle),
                  "0x1.fffffep+127"));
  assert (prints (BinaryFloat::smallest (BinaryFloat::ieeeSingle),
                  "0x1p-149"));
  assert (prints (BinaryFloat::x87DoubleExtended, "1.5", "0x1.8p+0"));
  assert (prints (BinaryFloat::largest (BinaryFloat::x87DoubleExtended),
                  "0x1.fffffffffffffffep+16383"));
  assert (prints (BinaryFloat::ieeeQuad, "0x1.0000000000000000000000000001p0",
                  "0x1.0000000000000000000000000001p+0"));
  assert (prints (BinaryFloat::smallest (BinaryFloat::ieeeHalf), "0x1p-24"));
  assert (prints (BinaryFloat::largest (BinaryFloat::ieeeHalf),
                  "0x1.ffcp+15"));
}

static void
test_round_trip (void)
{
  const char *tests[] = {
    "1", "-0.1", "3.14159", "1e-5", "65504", "-0", "0", "inf", "-inf",
    "nan", "nan(0x3)", "-snan(0x1)", "0x1.8p-3", "-7", 0
  };
  unsigned int i;

  for (i = 0; i < sizeof all_formats / sizeof all_formats[0]; i++)
    {
      const FloatFormat &format = *all_formats[i];
      BinaryFloat largestSubnormal (BinaryFloat::smallestNormalized (format));
      const char **text;

      for (text = tests; *text; text++)
        assert (reads_back (BinaryFloat (format, *text)));

      assert (reads_back (BinaryFloat::largest (format)));
      assert (reads_back (BinaryFloat::largest (format, true)));
      assert (reads_back (BinaryFloat::smallest (format)));
      assert (reads_back (BinaryFloat::smallest (format, true)));
      assert (reads_back (BinaryFloat::smallestNormalized (format)));

      assert (largestSubnormal.nextDown () == opOK);
      assert (largestSubnormal.isSubnormal ());
      assert (reads_back (largestSubnormal));
    }
}

int main (void)
{
  test_expected_text ();
  test_round_trip ();

  return 0;
}
