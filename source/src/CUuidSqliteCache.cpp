#include <iterator>

#include "CUuidSqliteCache.hpp"

namespace lap
{
namespace uid
{
    // ==================== Constructor/Destructor ====================

    UuidSqliteCache::UuidSqliteCache( ConstructionToken, core::StringView file, const UidCacheConfig& config ) noexcept
        : m_strFile( file )
        , m_config( config )
    {
        ;
    }

    UuidSqliteCache::~UuidSqliteCache() noexcept
    {
        finalizeStatements();

        if( m_pDB )
        {
            sqlite3_close( m_pDB );
            m_pDB = nullptr;
            LAP_UID_LOG_DEBUG << "SQLite cache closed: " << core::StringView(m_strFile);
        }
    }

    core::Result< core::SharedHandle< UuidSqliteCache > > UuidSqliteCache::Open( core::StringView path, const UidCacheConfig& config ) noexcept
    {
        using result = core::Result< core::SharedHandle< UuidSqliteCache > >;

        if( path.empty() )
        {
            LAP_UID_LOG_ERROR << "Empty cache file path";
            return result::FromError( UidErrc::kInvalidArgument );
        }

        auto configResult = ValidateConfig( config );
        if( !configResult.HasValue() )
        {
            return result::FromError( configResult.Error() );
        }

        auto pCache = ::std::make_shared< UuidSqliteCache >( ConstructionToken(), path, config );

        auto initResult = pCache->initializeDatabase();
        if( !initResult.HasValue() )
        {
            LAP_UID_LOG_ERROR << "Failed to initialize cache: " << path;
            return result::FromError( initResult.Error() );
        }

        LAP_UID_LOG_INFO << "SQLite cache opened successfully: " << path;
        return result::FromValue( ::std::move( pCache ) );
    }

    core::Result< void > UuidSqliteCache::ValidateConfig( const UidCacheConfig& config ) noexcept
    {
        static const core::Char* const s_journalModes[] = { "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF" };
        static const core::Char* const s_syncModes[] = { "OFF", "NORMAL", "FULL", "EXTRA" };

        auto isOneOf = []( const core::String& value, const core::Char* const* begin, const core::Char* const* end ) {
            for( auto it = begin; it != end; ++it )
            {
                if( value == *it ) return true;
            }
            return false;
        };

        // both end up inside a PRAGMA statement, only sqlite keywords pass
        if( !isOneOf( config.journalMode, ::std::begin( s_journalModes ), ::std::end( s_journalModes ) ) )
        {
            LAP_UID_LOG_ERROR << "Invalid journalMode: " << config.journalMode;
            return core::Result< void >::FromError( UidErrc::kInvalidArgument );
        }

        if( !isOneOf( config.synchronous, ::std::begin( s_syncModes ), ::std::end( s_syncModes ) ) )
        {
            LAP_UID_LOG_ERROR << "Invalid synchronous: " << config.synchronous;
            return core::Result< void >::FromError( UidErrc::kInvalidArgument );
        }

        return core::Result< void >::FromValue();
    }

    // ==================== Database Initialization ====================

    core::Result< void > UuidSqliteCache::initializeDatabase() noexcept
    {
        core::LockGuard lock( m_mutex );

        core::Int32 rc = sqlite3_initialize();
        if( rc != SQLITE_OK || sqlite3_threadsafe() == 0 )
        {
            LAP_UID_LOG_ERROR << "SQLite library is not usable, rc = " << rc;
            return core::Result< void >::FromError( makeErrorCode( CacheErrorCause::kDriverNotAvailable, rc ) );
        }

        core::Int32 flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        rc = sqlite3_open_v2( m_strFile.c_str(), &m_pDB, flags, nullptr );

        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_ERROR << "Failed to open SQLite database: " << ( m_pDB ? sqlite3_errmsg( m_pDB ) : "out of memory" );
            core::Int32 extended = m_pDB ? sqlite3_extended_errcode( m_pDB ) : rc;
            if( m_pDB )
            {
                sqlite3_close( m_pDB );
                m_pDB = nullptr;
            }
            return core::Result< void >::FromError( makeErrorCode( CacheErrorCause::kConnectionFailed, extended ) );
        }

        sqlite3_extended_result_codes( m_pDB, 1 );

        auto pragmaResult = applyPragmas();
        if( !pragmaResult.HasValue() )
        {
            return pragmaResult;
        }

        auto schemaResult = createSchema();
        if( !schemaResult.HasValue() )
        {
            return schemaResult;
        }

        return prepareStatements();
    }

    core::Result< void > UuidSqliteCache::applyPragmas() noexcept
    {
        core::Int32 rc = sqlite3_busy_timeout( m_pDB, static_cast< core::Int32 >( m_config.busyTimeoutMs ) );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_WARN << "Failed to set busy timeout: " << sqlite3_errmsg( m_pDB );
        }

        // journal_mode and synchronous were checked by ValidateConfig in Open
        core::String journalSQL = "PRAGMA journal_mode=" + m_config.journalMode + ";";
        core::String syncSQL = "PRAGMA synchronous=" + m_config.synchronous + ";";

        char* errMsg = nullptr;
        rc = sqlite3_exec( m_pDB, journalSQL.c_str(), nullptr, nullptr, &errMsg );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_WARN << "Failed to set journal mode " << m_config.journalMode << ": " << ( errMsg ? errMsg : "unknown error" );
            if( errMsg ) sqlite3_free( errMsg );
            errMsg = nullptr;
        }

        rc = sqlite3_exec( m_pDB, syncSQL.c_str(), nullptr, nullptr, &errMsg );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_WARN << "Failed to set synchronous mode " << m_config.synchronous << ": " << ( errMsg ? errMsg : "unknown error" );
            if( errMsg ) sqlite3_free( errMsg );
        }

        return core::Result< void >::FromValue();
    }

    core::Result< void > UuidSqliteCache::createSchema() noexcept
    {
        char* errMsg = nullptr;
        core::String createTableSQL = CacheQueryBuilder::BuildCreateTable();

        core::Int32 rc = sqlite3_exec( m_pDB, createTableSQL.c_str(), nullptr, nullptr, &errMsg );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_ERROR << "Failed to create table: " << ( errMsg ? errMsg : "unknown error" );
            if( errMsg ) sqlite3_free( errMsg );
            return core::Result< void >::FromError( makeErrorCode( CacheErrorCause::kSchemaCreationFailed, sqlite3_extended_errcode( m_pDB ) ) );
        }

        core::String createIndexSQL = CacheQueryBuilder::BuildCreateNameIndex();
        rc = sqlite3_exec( m_pDB, createIndexSQL.c_str(), nullptr, nullptr, &errMsg );
        if( rc != SQLITE_OK )
        {
            core::Bool bExists = ( errMsg != nullptr ) && CacheQueryBuilder::IsIndexAlreadyExists( errMsg );
            if( bExists )
            {
                LAP_UID_LOG_DEBUG << "Name index already exists";
                sqlite3_free( errMsg );
                return core::Result< void >::FromValue();
            }

            LAP_UID_LOG_ERROR << "Failed to create index: " << ( errMsg ? errMsg : "unknown error" );
            if( errMsg ) sqlite3_free( errMsg );
            return core::Result< void >::FromError( makeErrorCode( CacheErrorCause::kSchemaCreationFailed, sqlite3_extended_errcode( m_pDB ) ) );
        }

        return core::Result< void >::FromValue();
    }

    // ==================== Prepared Statements ====================

    core::Result< void > UuidSqliteCache::prepareStatements() noexcept
    {
        core::String upsertSQL = CacheQueryBuilder::BuildUpsert();

        core::Int32 rc = sqlite3_prepare_v2( m_pDB, upsertSQL.c_str(), -1, &m_pStmtUpsert, nullptr );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_ERROR << "Failed to prepare upsert statement: " << sqlite3_errmsg( m_pDB );
            return core::Result< void >::FromError( makeErrorCode( CacheErrorCause::kPrepareFailed, rc ) );
        }

        return core::Result< void >::FromValue();
    }

    void UuidSqliteCache::finalizeStatements() noexcept
    {
        if( m_pStmtUpsert ) { sqlite3_finalize( m_pStmtUpsert ); m_pStmtUpsert = nullptr; }
    }

    // ==================== Public API Implementation ====================

    core::Result< void > UuidSqliteCache::PutAll( const UuidNameMap& entries ) noexcept
    {
        using result = core::Result< void >;

        auto checkResult = checkIdentifiers( entries );
        if( !checkResult.HasValue() )
        {
            return checkResult;
        }

        if( entries.empty() )
        {
            return result::FromValue();
        }

        core::LockGuard lock( m_mutex );

        for( const auto& entry : entries )
        {
            core::String strUuid = entry.first.ToString();

            sqlite3_reset( m_pStmtUpsert );
            sqlite3_bind_text( m_pStmtUpsert, 1, entry.second.data(), static_cast< core::Int32 >( entry.second.size() ), SQLITE_TRANSIENT );
            sqlite3_bind_text( m_pStmtUpsert, 2, strUuid.data(), static_cast< core::Int32 >( strUuid.size() ), SQLITE_TRANSIENT );

            core::Int32 rc = sqlite3_step( m_pStmtUpsert );
            if( rc != SQLITE_DONE )
            {
                core::Int32 extended = sqlite3_extended_errcode( m_pDB );
                LAP_UID_LOG_ERROR << "Failed to write uuid '" << strUuid << "': " << sqlite3_errmsg( m_pDB );
                sqlite3_reset( m_pStmtUpsert );
                return result::FromError( makeErrorCode( CacheErrorCause::kQueryFailed, extended ) );
            }

            ++m_statistics.rowsWritten;
        }

        sqlite3_reset( m_pStmtUpsert );
        sqlite3_clear_bindings( m_pStmtUpsert );

        return result::FromValue();
    }

    core::Result< UuidNameMap > UuidSqliteCache::GetAllPresent( const UuidList& uuids ) noexcept
    {
        using result = core::Result< UuidNameMap >;

        auto checkResult = checkIdentifiers( uuids );
        if( !checkResult.HasValue() )
        {
            return result::FromError( checkResult.Error() );
        }

        // an empty IN () is not valid SQL, nothing to ask anyway
        if( uuids.empty() )
        {
            return result::FromValue( UuidNameMap() );
        }

        core::LockGuard lock( m_mutex );

        CacheResultBuilder builder( uuids.size() );
        auto itBegin = uuids.cbegin();

        for( core::Size uChunk : CacheQueryBuilder::SplitBatch( uuids.size(), batchLimit() ) )
        {
            auto selectResult = executeSelect( itBegin, uChunk, builder );
            if( !selectResult.HasValue() )
            {
                return result::FromError( selectResult.Error() );
            }

            itBegin += static_cast< UuidList::difference_type >( uChunk );
        }

        m_statistics.rowsReturned += builder.RowCount();

        return result::FromValue( builder.Release() );
    }

    core::Result< core::UInt64 > UuidSqliteCache::GetEntryCount() const noexcept
    {
        using result = core::Result< core::UInt64 >;

        core::LockGuard lock( m_mutex );

        core::String countSQL = CacheQueryBuilder::BuildCount();
        sqlite3_stmt* stmt = nullptr;

        core::Int32 rc = sqlite3_prepare_v2( m_pDB, countSQL.c_str(), -1, &stmt, nullptr );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_ERROR << "Failed to prepare count statement: " << sqlite3_errmsg( m_pDB );
            return result::FromError( makeErrorCode( CacheErrorCause::kPrepareFailed, rc ) );
        }

        rc = sqlite3_step( stmt );
        if( rc != SQLITE_ROW )
        {
            core::Int32 extended = sqlite3_extended_errcode( m_pDB );
            LAP_UID_LOG_ERROR << "Failed to count entries: " << sqlite3_errmsg( m_pDB );
            sqlite3_finalize( stmt );
            return result::FromError( makeErrorCode( CacheErrorCause::kQueryFailed, extended ) );
        }

        core::UInt64 count = static_cast< core::UInt64 >( sqlite3_column_int64( stmt, 0 ) );
        sqlite3_finalize( stmt );

        return result::FromValue( count );
    }

    CacheStatistics UuidSqliteCache::GetStatistics() const noexcept
    {
        core::LockGuard lock( m_mutex );

        return m_statistics;
    }

    // ==================== Batched Lookup ====================

    core::Result< void > UuidSqliteCache::executeSelect( UuidList::const_iterator itBegin, core::Size uCount,
                                                         CacheResultBuilder& builder ) noexcept
    {
        using result = core::Result< void >;

        core::String selectSQL = CacheQueryBuilder::BuildSelectIn( uCount );
        sqlite3_stmt* stmt = nullptr;

        core::Int32 rc = sqlite3_prepare_v2( m_pDB, selectSQL.c_str(), -1, &stmt, nullptr );
        if( rc != SQLITE_OK )
        {
            LAP_UID_LOG_ERROR << "Failed to prepare select statement: " << sqlite3_errmsg( m_pDB );
            return result::FromError( makeErrorCode( CacheErrorCause::kPrepareFailed, rc ) );
        }

        core::Int32 index = 1;
        for( auto it = itBegin; index <= static_cast< core::Int32 >( uCount ); ++it, ++index )
        {
            core::String strUuid = it->ToString();
            sqlite3_bind_text( stmt, index, strUuid.data(), static_cast< core::Int32 >( strUuid.size() ), SQLITE_TRANSIENT );
        }

        ++m_statistics.queriesExecuted;

        while( ( rc = sqlite3_step( stmt ) ) == SQLITE_ROW )
        {
            // column_bytes after column_text, the byte count then matches the text form
            const char* name = reinterpret_cast< const char* >( sqlite3_column_text( stmt, 0 ) );
            core::Size uNameLen = static_cast< core::Size >( sqlite3_column_bytes( stmt, 0 ) );
            const char* uuid = reinterpret_cast< const char* >( sqlite3_column_text( stmt, 1 ) );
            core::Size uUuidLen = static_cast< core::Size >( sqlite3_column_bytes( stmt, 1 ) );

            auto rowResult = builder.AddRow( name, uNameLen, uuid, uUuidLen );
            if( !rowResult.HasValue() )
            {
                sqlite3_finalize( stmt );
                return rowResult;
            }
        }

        if( rc != SQLITE_DONE )
        {
            core::Int32 extended = sqlite3_extended_errcode( m_pDB );
            LAP_UID_LOG_ERROR << "Failed to execute lookup: " << sqlite3_errmsg( m_pDB );
            sqlite3_finalize( stmt );
            return result::FromError( makeErrorCode( CacheErrorCause::kQueryFailed, extended ) );
        }

        sqlite3_finalize( stmt );
        return result::FromValue();
    }

    core::Size UuidSqliteCache::batchLimit() const noexcept
    {
        core::Size uLimit = static_cast< core::Size >( sqlite3_limit( m_pDB, SQLITE_LIMIT_VARIABLE_NUMBER, -1 ) );

        if( m_config.maxBatchSize != 0 && m_config.maxBatchSize < uLimit )
        {
            uLimit = m_config.maxBatchSize;
        }

        return uLimit;
    }

    // ==================== Error Handling ====================

    core::ErrorCode UuidSqliteCache::makeErrorCode( CacheErrorCause cause, core::Int32 sqliteCode ) const noexcept
    {
        return MakeCacheError( cause, sqliteCode );
    }

} // namespace uid
} // namespace lap
