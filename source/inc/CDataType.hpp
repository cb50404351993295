/**
 * @file CDataType.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Common types of the uuid cache: identifier value, entry maps, configuration
 * @version 0.1
 * @date 2025-12-02
 *
 *
 */
#ifndef LAP_UIDCACHE_DATATYPE_HPP
#define LAP_UIDCACHE_DATATYPE_HPP

#include <functional>
#include <ostream>

// core
#include <lap/core/CTypedef.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CResult.hpp>
#include <lap/log/CLog.hpp>

// uidcache common
#include "CUidErrorDomain.hpp"

namespace lap
{
namespace uid
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_UID_LOG_CONTEXT_ID       "UID"
    #define LAP_UID_LOG_CONTEXT_DESC     "UID cache log ctx"

#ifdef LAP_DEBUG
    #define LAP_UID_LOG                  LAP_LOG( LAP_UID_LOG_CONTEXT_ID, LAP_UID_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_UID_LOG_VERBOSE          LAP_UID_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_UID_LOG_DEBUG            LAP_UID_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_UID_LOG_INFO             LAP_UID_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_UID_LOG                  LAP_LOG( LAP_UID_LOG_CONTEXT_ID, LAP_UID_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_UID_LOG_VERBOSE          LAP_UID_LOG.LogOff()
    #define LAP_UID_LOG_DEBUG            LAP_UID_LOG.LogOff()
    #define LAP_UID_LOG_INFO             LAP_UID_LOG.LogOff()
#endif
    #define LAP_UID_LOG_WARN             LAP_UID_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_UID_LOG_ERROR            LAP_UID_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_UID_LOG_FATAL            LAP_UID_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Cache Default Configuration
    // ========================================================================
    #define LAP_UID_CONFIG_MODULE                   "uidcache"
    #define LAP_UID_DEFAULT_DATABASE_PATH           "/tmp/uidcache/uuid_cache.db"
    #define LAP_UID_DEFAULT_JOURNAL_MODE            "WAL"
    #define LAP_UID_DEFAULT_SYNCHRONOUS             "NORMAL"
    #define LAP_UID_DEFAULT_BUSY_TIMEOUT_MS         5000U

    // Schema
    #define LAP_UID_TABLE_NAME                      "uuid_cache"
    #define LAP_UID_NAME_INDEX                      "name_index"
    #define LAP_UID_NAME_MAX_LENGTH                 32U     // documentation only, not enforced

    // Canonical text form: 8-4-4-4-12
    #define LAP_UID_UUID_STRING_LENGTH              36U

    /**
     * @brief 128-bit identifier
     *
     * Canonical text form is the 36 character lowercase hyphenated hex string.
     * A default constructed Uuid is the nil identifier (all zero), which the
     * cache treats as "no identifier" and rejects as input.
     */
    class Uuid final
    {
    public:
        constexpr Uuid() noexcept = default;
        constexpr Uuid( core::UInt64 mostSigBits, core::UInt64 leastSigBits ) noexcept
            : m_uMostSigBits( mostSigBits )
            , m_uLeastSigBits( leastSigBits )
        {
            ;
        }

        /**
         * @brief Parse the canonical text form
         *
         * @param strText 36 characters, hyphens at 8, 13, 18 and 23, hex digits in either case
         * @return core::Result< Uuid > the value, or UidErrc::kInvalidArgument when malformed
         */
        static core::Result< Uuid >             FromString( core::StringView strText ) noexcept;

        core::String                            ToString() const;

        constexpr core::Bool                    IsNil() const noexcept                  { return m_uMostSigBits == 0 && m_uLeastSigBits == 0; }
        constexpr core::UInt64                  GetMostSignificantBits() const noexcept { return m_uMostSigBits; }
        constexpr core::UInt64                  GetLeastSignificantBits() const noexcept{ return m_uLeastSigBits; }

        constexpr core::Bool operator==( const Uuid& other ) const noexcept
        {
            return m_uMostSigBits == other.m_uMostSigBits && m_uLeastSigBits == other.m_uLeastSigBits;
        }

        constexpr core::Bool operator!=( const Uuid& other ) const noexcept
        {
            return !( *this == other );
        }

        constexpr core::Bool operator<( const Uuid& other ) const noexcept
        {
            return m_uMostSigBits < other.m_uMostSigBits
                || ( m_uMostSigBits == other.m_uMostSigBits && m_uLeastSigBits < other.m_uLeastSigBits );
        }

    private:
        core::UInt64                            m_uMostSigBits{ 0 };
        core::UInt64                            m_uLeastSigBits{ 0 };
    };

    ::std::ostream& operator<<( ::std::ostream& os, const Uuid& uuid );
} // namespace uid
} // namespace lap

namespace std
{
    template<>
    struct hash< ::lap::uid::Uuid >
    {
        ::std::size_t operator()( const ::lap::uid::Uuid& uuid ) const noexcept
        {
            ::lap::core::UInt64 mix = uuid.GetMostSignificantBits() ^ uuid.GetLeastSignificantBits();
            return ::std::hash< ::lap::core::UInt64 >()( mix );
        }
    };
} // namespace std

namespace lap
{
namespace uid
{
    using UuidList          = core::Vector< Uuid >;
    using UuidNameMap       = core::UnorderedMap< Uuid, core::String >;

    // ========================================================================
    // Cache Configuration Structure
    // ========================================================================

    /**
     * @brief Uuid cache configuration
     * Loaded from Core::ConfigManager "uidcache" module
     */
    struct UidCacheConfig {
        core::String databasePath{ LAP_UID_DEFAULT_DATABASE_PATH };
        core::String journalMode{ LAP_UID_DEFAULT_JOURNAL_MODE };      // DELETE, TRUNCATE, PERSIST, MEMORY, WAL, OFF
        core::String synchronous{ LAP_UID_DEFAULT_SYNCHRONOUS };       // OFF, NORMAL, FULL, EXTRA
        core::UInt32 busyTimeoutMs{ LAP_UID_DEFAULT_BUSY_TIMEOUT_MS };
        core::UInt32 maxBatchSize{ 0 };                                 // 0: bounded by the sqlite host parameter limit only
    };

    /**
     * @brief Counters kept by the sqlite store, mostly for diagnostics and tests
     */
    struct CacheStatistics {
        core::UInt64 queriesExecuted{ 0 };
        core::UInt64 rowsWritten{ 0 };
        core::UInt64 rowsReturned{ 0 };
    };
} // namespace uid
} // namespace lap

#endif
