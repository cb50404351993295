/**
 * @file CUidErrorDomain.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Error domain of the uuid cache
 * @version 0.1
 * @date 2025-12-02
 *
 *
 */
#ifndef LAP_UIDCACHE_UIDERRORDOMAIN_HPP
#define LAP_UIDCACHE_UIDERRORDOMAIN_HPP

#include <exception>
#include <lap/core/CTypedef.hpp>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>

namespace lap
{
namespace uid
{
    enum class UidErrc : core::ErrorDomain::CodeType
    {
        kCacheError                 = 1,
        kInvalidArgument            = 2,
        kKeyNotFound                = 3,
        kNotInitialized             = 4
    };

    /**
     * @brief Lower level cause carried by a kCacheError
     *
     * All storage failures share the single kCacheError kind, the cause tells
     * them apart for diagnosis.
     */
    enum class CacheErrorCause : core::UInt8
    {
        kUnknown                    = 0,
        kDriverNotAvailable         = 1,
        kConnectionFailed           = 2,
        kSchemaCreationFailed       = 3,
        kPrepareFailed              = 4,
        kQueryFailed                = 5,
        kCorruptedRow               = 6
    };

    inline constexpr const core::Char* UidErrMessage( UidErrc errCode )
    {
        switch ( errCode ) {
        case UidErrc::kCacheError:
            return "The cache store could not complete the operation.";
        case UidErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        case UidErrc::kKeyNotFound:
            return "The provided identifier is not present in the cache.";
        case UidErrc::kNotInitialized:
            return "The cache store is not opened.";
        default:
            return "Unknown error";
        }
    }

    inline constexpr const core::Char* CacheErrorCauseMessage( CacheErrorCause cause )
    {
        switch ( cause ) {
        case CacheErrorCause::kDriverNotAvailable:
            return "SQLite support is not available";
        case CacheErrorCause::kConnectionFailed:
            return "Failed to connect to cache file";
        case CacheErrorCause::kSchemaCreationFailed:
            return "Failed to create tables";
        case CacheErrorCause::kPrepareFailed:
            return "Failed to prepare statements";
        case CacheErrorCause::kQueryFailed:
            return "Failed to execute queries";
        case CacheErrorCause::kCorruptedRow:
            return "Stored row is malformed";
        default:
            return "Unknown cause";
        }
    }

    class UidException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(UidException)

        explicit UidException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~UidException() noexcept
        {
            ;
        }

        const core::Char* what() const noexcept
        {
            return UidErrMessage( static_cast< UidErrc > ( Error().Value() ) );
        }
    };

    class UidErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(UidErrorDomain)

        using Errc          = UidErrc;
        using Exception     = UidException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "UidErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return UidErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw UidException( errorCode ); }

        constexpr UidErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr UidErrorDomain g_uidErrorDomain;

    constexpr const core::ErrorDomain& GetUidDomain () noexcept
    {
        return g_uidErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( UidErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetUidDomain(), data };
    }

    // support data layout of a kCacheError: bits 16..23 cause, bits 0..15 sqlite extended result code
    constexpr core::ErrorCode MakeCacheError ( CacheErrorCause cause, core::Int32 storageCode ) noexcept
    {
        return MakeErrorCode( UidErrc::kCacheError,
                              static_cast< core::ErrorDomain::SupportDataType >(
                                  ( static_cast< core::Int32 >( cause ) << 16 ) | ( storageCode & 0xFFFF ) ) );
    }

    inline core::Bool IsCacheError ( const core::ErrorCode& errorCode ) noexcept
    {
        return errorCode.Domain() == GetUidDomain()
            && errorCode.Value() == static_cast< core::ErrorDomain::CodeType >( UidErrc::kCacheError );
    }

    inline CacheErrorCause GetCacheErrorCause ( const core::ErrorCode& errorCode ) noexcept
    {
        if ( !IsCacheError( errorCode ) ) return CacheErrorCause::kUnknown;

        return static_cast< CacheErrorCause >( ( static_cast< core::Int32 >( errorCode.SupportData() ) >> 16 ) & 0xFF );
    }

    inline core::Int32 GetStorageResultCode ( const core::ErrorCode& errorCode ) noexcept
    {
        if ( !IsCacheError( errorCode ) ) return 0;

        return static_cast< core::Int32 >( errorCode.SupportData() ) & 0xFFFF;
    }
} // namespace uid
} // namespace lap

#endif
