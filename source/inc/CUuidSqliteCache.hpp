/**
 * @file CUuidSqliteCache.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Uuid cache persisted in a single SQLite file
 * @version 0.1
 * @date 2025-12-03
 *
 *
 */
#ifndef LAP_UIDCACHE_UUIDSQLITECACHE_HPP
#define LAP_UIDCACHE_UUIDSQLITECACHE_HPP

#include <sqlite3.h>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>
#include <memory>

#include "CDataType.hpp"
#include "IUuidCache.hpp"
#include "CCacheQueryBuilder.hpp"

namespace lap
{
namespace uid
{
    /**
     * @brief SQLite implementation of IUuidCache
     *
     * One connection per instance, opened by Open() and closed by the destructor.
     * PutAll and GetAllPresent hold the same mutex for their whole run, so calls
     * from different threads execute one at a time against the connection.
     */
    class UuidSqliteCache final : public IUuidCache
    {
    private:
        // passkey, only Open() can construct
        struct ConstructionToken
        {
            explicit ConstructionToken() = default;
        };

    public:
        IMP_OPERATOR_NEW(UuidSqliteCache)

    public:
        /**
         * @brief Open or create the cache file and make sure the schema exists
         *
         * @param path sqlite file path
         * @param config connection settings
         * @return the opened store, UidErrc::kInvalidArgument for an empty path or a config
         *         rejected by ValidateConfig, or UidErrc::kCacheError with cause
         *         kDriverNotAvailable, kConnectionFailed, kSchemaCreationFailed or kPrepareFailed
         */
        static core::Result< core::SharedHandle< UuidSqliteCache > >
                                                Open( core::StringView path, const UidCacheConfig& config = UidCacheConfig() ) noexcept;

        /**
         * @brief Check the connection settings before they reach a PRAGMA statement
         *
         * journalMode must be one of DELETE, TRUNCATE, PERSIST, MEMORY, WAL, OFF and
         * synchronous one of OFF, NORMAL, FULL, EXTRA (exact upper case keywords).
         *
         * @retval UidErrc::kInvalidArgument on any other value
         */
        static core::Result< void >             ValidateConfig( const UidCacheConfig& config ) noexcept;

        UuidSqliteCache( ConstructionToken, core::StringView file, const UidCacheConfig& config ) noexcept;

        core::Result< void >                    PutAll( const UuidNameMap& entries ) noexcept override;
        core::Result< UuidNameMap >             GetAllPresent( const UuidList& uuids ) noexcept override;

        core::Result< core::UInt64 >            GetEntryCount() const noexcept;
        CacheStatistics                         GetStatistics() const noexcept;
        const core::String&                     GetPath() const noexcept            { return m_strFile; }

        ~UuidSqliteCache() noexcept;

    protected:
        UuidSqliteCache() = delete;
        UuidSqliteCache( const UuidSqliteCache& ) = delete;
        UuidSqliteCache& operator=( const UuidSqliteCache& ) = delete;

    private:
        core::Result< void >                    initializeDatabase() noexcept;
        core::Result< void >                    applyPragmas() noexcept;
        core::Result< void >                    createSchema() noexcept;
        core::Result< void >                    prepareStatements() noexcept;
        void                                    finalizeStatements() noexcept;

        // caller holds m_mutex
        core::Result< void >                    executeSelect( UuidList::const_iterator itBegin, core::Size uCount,
                                                               CacheResultBuilder& builder ) noexcept;
        core::Size                              batchLimit() const noexcept;

        core::ErrorCode                         makeErrorCode( CacheErrorCause cause, core::Int32 sqliteCode ) const noexcept;

    private:
        core::String                            m_strFile;
        UidCacheConfig                          m_config;
        sqlite3*                                m_pDB{ nullptr };
        mutable core::Mutex                     m_mutex;

        // reused by every PutAll
        sqlite3_stmt*                           m_pStmtUpsert{ nullptr };

        CacheStatistics                         m_statistics;
    };
} // namespace uid
} // namespace lap

#endif
