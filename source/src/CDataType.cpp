#include "CDataType.hpp"

namespace lap
{
namespace uid
{
    namespace
    {
        constexpr core::Char kHexDigits[] = "0123456789abcdef";

        inline core::Int32 hexValue( core::Char c ) noexcept
        {
            if ( c >= '0' && c <= '9' ) return c - '0';
            if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
            if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;

            return -1;
        }

        inline core::Bool isHyphenPosition( core::Size pos ) noexcept
        {
            return pos == 8 || pos == 13 || pos == 18 || pos == 23;
        }
    }

    core::Result< Uuid > Uuid::FromString( core::StringView strText ) noexcept
    {
        using result = core::Result< Uuid >;

        if ( strText.size() != LAP_UID_UUID_STRING_LENGTH ) {
            return result::FromError( UidErrc::kInvalidArgument );
        }

        core::UInt64 msb = 0;
        core::UInt64 lsb = 0;
        core::UInt32 nibbles = 0;

        for ( core::Size pos = 0; pos < strText.size(); ++pos ) {
            if ( isHyphenPosition( pos ) ) {
                if ( strText[ pos ] != '-' ) return result::FromError( UidErrc::kInvalidArgument );
                continue;
            }

            core::Int32 value = hexValue( strText[ pos ] );
            if ( value < 0 ) return result::FromError( UidErrc::kInvalidArgument );

            // first 16 nibbles fill the most significant half
            if ( nibbles < 16 ) {
                msb = ( msb << 4 ) | static_cast< core::UInt64 >( value );
            } else {
                lsb = ( lsb << 4 ) | static_cast< core::UInt64 >( value );
            }
            ++nibbles;
        }

        return result::FromValue( Uuid( msb, lsb ) );
    }

    core::String Uuid::ToString() const
    {
        core::String strText;
        strText.reserve( LAP_UID_UUID_STRING_LENGTH );

        for ( core::Int32 shift = 60; shift >= 0; shift -= 4 ) {
            if ( shift == 28 || shift == 12 ) strText += '-';
            strText += kHexDigits[ ( m_uMostSigBits >> shift ) & 0xF ];
        }

        for ( core::Int32 shift = 60; shift >= 0; shift -= 4 ) {
            if ( shift == 60 || shift == 44 ) strText += '-';
            strText += kHexDigits[ ( m_uLeastSigBits >> shift ) & 0xF ];
        }

        return strText;
    }

    ::std::ostream& operator<<( ::std::ostream& os, const Uuid& uuid )
    {
        return os << uuid.ToString();
    }
} // namespace uid
} // namespace lap
