#include <lap/core/CPath.hpp>
#include <lap/log/CLog.hpp>
#include <nlohmann/json.hpp>

#include "CUidCacheManager.hpp"
#include "CUuidSqliteCache.hpp"
#include "CUuidMemoryCache.hpp"
#include "CUidErrorDomain.hpp"

namespace lap
{
namespace uid
{
    CUidCacheManager::~CUidCacheManager() noexcept
    {
        uninitialize();
    }

    core::Bool CUidCacheManager::initialize() noexcept
    {
        if ( m_bInitialized )     return true;

        auto configResult = loadCacheConfig();
        if ( configResult.HasValue() && validateConfig( configResult.Value() ).HasValue() ) {
            core::LockGuard lock( m_mtxConfig );
            m_config = configResult.Value();
        } else {
            LAP_UID_LOG_WARN << "Using default uid cache configuration";
        }

        m_bInitialized = true;

        return true;
    }

    void CUidCacheManager::uninitialize() noexcept
    {
        if ( !m_bInitialized )    return;

        {
            core::LockGuard lock( m_mtxCacheMap );

            // stores close when the last handle goes away
            m_cacheMap.clear();
        }

        m_bInitialized = false;
    }

    core::Result< core::SharedHandle< IUuidCache > > CUidCacheManager::getCache( core::StringView path ) noexcept
    {
        using result = core::Result< core::SharedHandle< IUuidCache > >;

        if ( !m_bInitialized ) return result::FromError( UidErrc::kNotInitialized );

        if ( path.empty() ) {
            LAP_UID_LOG_WARN << "CUidCacheManager::getCache with empty path";
            return result::FromError( UidErrc::kInvalidArgument );
        }

        core::LockGuard lock( m_mtxCacheMap );

        auto&& it = m_cacheMap.find( core::String( path ) );
        if ( it != m_cacheMap.end() ) {
            return result::FromValue( it->second );
        }

        auto dirResult = ensureParentDirectory( path );
        if ( !dirResult.HasValue() ) {
            return result::FromError( dirResult.Error() );
        }

        auto openResult = UuidSqliteCache::Open( path, getConfig() );
        if ( !openResult.HasValue() ) {
            LAP_UID_LOG_ERROR << "Failed to open uid cache " << path << ": "
                              << CacheErrorCauseMessage( GetCacheErrorCause( openResult.Error() ) );
            return result::FromError( openResult.Error() );
        }

        core::SharedHandle< IUuidCache > pCache = openResult.Value();
        m_cacheMap.emplace( core::String( path ), pCache );

        LAP_UID_LOG_INFO << "Uid cache registered: " << path;
        return result::FromValue( pCache );
    }

    core::Result< core::SharedHandle< IUuidCache > > CUidCacheManager::getDefaultCache() noexcept
    {
        core::String path = getConfig().databasePath;

        return getCache( path );
    }

    core::SharedHandle< IUuidCache > CUidCacheManager::createMemoryCache() noexcept
    {
        return ::std::make_shared< UuidMemoryCache >();
    }

    core::Size CUidCacheManager::getOpenCacheCount() noexcept
    {
        core::LockGuard lock( m_mtxCacheMap );

        return m_cacheMap.size();
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    core::Result< UidCacheConfig > CUidCacheManager::loadCacheConfig() noexcept
    {
        using result = core::Result< UidCacheConfig >;

        try {
            auto& configMgr = core::ConfigManager::getInstance();
            auto moduleConfig = configMgr.getModuleConfigJson( LAP_UID_CONFIG_MODULE );

            if ( moduleConfig.is_null() || moduleConfig.empty() ) {
                LAP_UID_LOG_WARN << "Uid cache module config not found, using defaults";
                return result::FromValue( UidCacheConfig() );
            }

            UidCacheConfig config;

            config.databasePath = moduleConfig.value( "databasePath", LAP_UID_DEFAULT_DATABASE_PATH );
            config.journalMode = moduleConfig.value( "journalMode", LAP_UID_DEFAULT_JOURNAL_MODE );
            config.synchronous = moduleConfig.value( "synchronous", LAP_UID_DEFAULT_SYNCHRONOUS );
            config.busyTimeoutMs = moduleConfig.value( "busyTimeoutMs", core::UInt32( LAP_UID_DEFAULT_BUSY_TIMEOUT_MS ) );
            config.maxBatchSize = moduleConfig.value( "maxBatchSize", core::UInt32( 0 ) );

            return result::FromValue( config );
        } catch ( const std::exception& e ) {
            LAP_UID_LOG_ERROR << "Failed to load uid cache config: " << e.what();
            return result::FromError( MakeErrorCode( UidErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< void > CUidCacheManager::validateConfig( const UidCacheConfig& config ) noexcept
    {
        using result = core::Result< void >;

        if ( config.databasePath.empty() ) {
            LAP_UID_LOG_ERROR << "databasePath cannot be empty";
            return result::FromError( MakeErrorCode( UidErrc::kInvalidArgument, 0 ) );
        }

        auto pragmaResult = UuidSqliteCache::ValidateConfig( config );
        if ( !pragmaResult.HasValue() ) {
            return pragmaResult;
        }

        return result::FromValue();
    }

    core::Result< void > CUidCacheManager::updateConfig( const UidCacheConfig& config ) noexcept
    {
        auto validateResult = validateConfig( config );
        if ( !validateResult.HasValue() ) {
            return validateResult;
        }

        core::LockGuard lock( m_mtxConfig );
        m_config = config;

        return core::Result< void >::FromValue();
    }

    UidCacheConfig CUidCacheManager::getConfig() noexcept
    {
        core::LockGuard lock( m_mtxConfig );

        return m_config;
    }

    core::Result< void > CUidCacheManager::ensureParentDirectory( core::StringView path ) noexcept
    {
        core::String filePathStr( path );
        auto lastSlashPos = filePathStr.rfind( '/' );

        if ( lastSlashPos == core::String::npos || lastSlashPos == 0 ) {
            return core::Result< void >::FromValue();
        }

        core::String dirPath = filePathStr.substr( 0, lastSlashPos );
        if ( !core::Path::isDirectory( dirPath ) && !core::Path::createDirectory( dirPath ) ) {
            LAP_UID_LOG_ERROR << "Failed to create cache directory: " << dirPath;
            return core::Result< void >::FromError( MakeCacheError( CacheErrorCause::kConnectionFailed, 0 ) );
        }

        return core::Result< void >::FromValue();
    }
} // namespace uid
} // namespace lap
