/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_NUMERIC_TRAITS_H
#define NUMLIT_NUMERIC_TRAITS_H

#include <stdint.h>
#include "binary_float.h"
#include "literal.h"

namespace numlit {

  /* Capabilities of host numeric types.  A type has a capability
     when the matching template is specialized for it; the primary
     templates are left undefined.

     IntegerLike<T>
       isSigned, toExact (T) and
       fromExact (const ExactInteger &, conversionPolicy, T &).

     FixedWidthIntegerLike<T>
       bitWidth, format (), toFixed (T) and fromFixed (const FixedInt &).

     BinaryFloatLike<T>
       format (), toBinary (T) and fromBinary (const BinaryFloat &).  */
  template <typename T> struct IntegerLike;
  template <typename T> struct FixedWidthIntegerLike;
  template <typename T> struct BinaryFloatLike;

#define NUMLIT_FIXED_WIDTH_INTEGER(type, intFormat, signedness, extract) \
  template <> struct FixedWidthIntegerLike<type>                          \
  {                                                                       \
    static const unsigned int bitWidth = sizeof (type) * NUMLIT_HOST_CHAR_BIT; \
    static const IntFormat &format () { return FixedInt::intFormat; }    \
    static FixedInt toFixed (type value)                                  \
    {                                                                     \
      return FixedInt (format (), (long long) value);                     \
    }                                                                     \
    static type fromFixed (const FixedInt &value)                         \
    {                                                                     \
      return (type) value.extract ();                                     \
    }                                                                     \
  };                                                                      \
                                                                          \
  template <> struct IntegerLike<type>                                    \
  {                                                                       \
    static const bool isSigned = signedness;                              \
    static ExactInteger toExact (type value)                              \
    {                                                                     \
      return FixedWidthIntegerLike<type>::toFixed (value).toExact ();     \
    }                                                                     \
    static opStatus fromExact (const ExactInteger &value,                 \
                               conversionPolicy policy, type &result)     \
    {                                                                     \
      const IntFormat &f = FixedWidthIntegerLike<type>::format ();        \
      FixedInt converted (f, 0);                                          \
      opStatus status;                                                    \
                                                                          \
      status = converted.convertFromExactInteger (value, f, policy);     \
      if (status != opInvalidOp)                                          \
        result = FixedWidthIntegerLike<type>::fromFixed (converted);     \
      return status;                                                      \
    }                                                                     \
  }

  NUMLIT_FIXED_WIDTH_INTEGER (int8_t, int8, true, getSExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (int16_t, int16, true, getSExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (int32_t, int32, true, getSExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (int64_t, int64, true, getSExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (uint8_t, uint8, false, getZExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (uint16_t, uint16, false, getZExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (uint32_t, uint32, false, getZExtValue);
  NUMLIT_FIXED_WIDTH_INTEGER (uint64_t, uint64, false, getZExtValue);

#undef NUMLIT_FIXED_WIDTH_INTEGER

  template <> struct BinaryFloatLike<float>
  {
    static const FloatFormat &format () { return BinaryFloat::ieeeSingle; }
    static BinaryFloat toBinary (float value) { return BinaryFloat (value); }
    static float fromBinary (const BinaryFloat &value)
    {
      return value.convertToFloat ();
    }
  };

  template <> struct BinaryFloatLike<double>
  {
    static const FloatFormat &format () { return BinaryFloat::ieeeDouble; }
    static BinaryFloat toBinary (double value) { return BinaryFloat (value); }
    static double fromBinary (const BinaryFloat &value)
    {
      return value.convertToDouble ();
    }
  };

  /* Parse an integer literal into T.  Returns opSyntaxError, or
     opInvalidOp if the value does not fit; RESULT is only written on
     success.  */
  template <typename T>
  opStatus
  integerLiteralValue (const char *text, T &result)
  {
    ExactInteger value;

    if (parseIntegerLiteral (text, value) != opOK)
      return opSyntaxError;

    return IntegerLike<T>::fromExact (value, cpExactly, result);
  }

  /* Round a literal, integer or floating, once into T.  */
  template <typename T>
  opStatus
  floatLiteralValue (const char *text, T &result)
  {
    BinaryFloat value (BinaryFloatLike<T>::format (), BinaryFloat::fcZero,
                       false);
    opStatus status;

    status = value.convertFromLiteral (text);
    if (status != opSyntaxError)
      result = BinaryFloatLike<T>::fromBinary (value);

    return status;
  }

  /* Parse a runtime string into T; RESULT is only written when opOK
     or opInexact is returned.  */
  template <typename T>
  opStatus
  floatStringValue (const char *text, T &result)
  {
    BinaryFloat value (BinaryFloatLike<T>::format (), BinaryFloat::fcZero,
                       false);
    opStatus status;

    status = value.convertFromString (text);
    if (status == opOK || status == opInexact)
      result = BinaryFloatLike<T>::fromBinary (value);

    return status;
  }

  /* Convert between host integer types under POLICY.  RESULT is left
     alone when opInvalidOp is returned.  */
  template <typename To, typename From>
  opStatus
  convertInteger (From value, conversionPolicy policy, To &result)
  {
    FixedInt converted (FixedWidthIntegerLike<From>::toFixed (value));
    opStatus status;

    status = converted.convert (FixedWidthIntegerLike<To>::format (), policy);
    if (status != opInvalidOp)
      result = FixedWidthIntegerLike<To>::fromFixed (converted);

    return status;
  }

  /* Convert between host floating types under POLICY.  */
  template <typename To, typename From>
  opStatus
  convertFloat (From value, conversionPolicy policy, To &result)
  {
    BinaryFloat converted (BinaryFloatLike<From>::toBinary (value));
    opStatus status;

    status = converted.convert (BinaryFloatLike<To>::format (), policy);
    if (status != opInvalidOp || policy != cpExactly)
      result = BinaryFloatLike<To>::fromBinary (converted);

    return status;
  }

  /* Host integer arithmetic reporting overflow: RESULT gets the
     wrapped value.  */
  template <typename T>
  bool
  addReportingOverflow (T lhs, T rhs, T &result)
  {
    FixedInt sum (FixedWidthIntegerLike<T>::toFixed (lhs));
    bool overflow;

    overflow = sum.addReportingOverflow (FixedWidthIntegerLike<T>::toFixed (rhs));
    result = FixedWidthIntegerLike<T>::fromFixed (sum);

    return overflow;
  }

  template <typename T>
  bool
  multiplyReportingOverflow (T lhs, T rhs, T &result)
  {
    FixedInt product (FixedWidthIntegerLike<T>::toFixed (lhs));
    bool overflow;

    overflow = product.multiplyReportingOverflow
      (FixedWidthIntegerLike<T>::toFixed (rhs));
    result = FixedWidthIntegerLike<T>::fromFixed (product);

    return overflow;
  }
}

#endif /* NUMLIT_NUMERIC_TRAITS_H */
