/**
 * @file CUidCacheManager.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Process wide owner of the uuid cache stores
 * @version 0.1
 * @date 2025-12-04
 *
 *
 */
#ifndef LAP_UIDCACHE_UIDCACHEMANAGER_HPP
#define LAP_UIDCACHE_UIDCACHEMANAGER_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>
#include <lap/core/CConfig.hpp>

#include "CDataType.hpp"
#include "IUuidCache.hpp"

namespace lap
{
namespace uid
{
    class CUidCacheManager final
    {
    public:
        IMP_OPERATOR_NEW(CUidCacheManager)

    private:
        using _CacheMap         = core::UnorderedMap< core::String, core::SharedHandle< IUuidCache > >;

    public:
        static CUidCacheManager& getInstance() noexcept
        {
            static CUidCacheManager instance;

            return instance;
        }

        core::Bool                              initialize() noexcept;
        void                                    uninitialize() noexcept;
        inline core::Bool                       isInitialized() noexcept             { return m_bInitialized; }

        // ========================================================================
        // Cache Management
        // ========================================================================

        /**
         * @brief Get the SQLite cache of a file, opening it on first use
         *
         * Every call with the same path returns the same store, so the process
         * keeps exactly one connection per cache file.
         *
         * @param path sqlite file path, parent directory is created if missing
         * @return SharedHandle to the cache
         */
        core::Result< core::SharedHandle< IUuidCache > >        getCache( core::StringView path ) noexcept;

        /**
         * @brief Get the SQLite cache at the configured databasePath
         */
        core::Result< core::SharedHandle< IUuidCache > >        getDefaultCache() noexcept;

        /**
         * @brief Create a standalone in-memory cache, not tracked by the manager
         */
        core::SharedHandle< IUuidCache >                        createMemoryCache() noexcept;

        core::Size                              getOpenCacheCount() noexcept;

        // ========================================================================
        // Configuration
        // ========================================================================

        /**
         * @brief Load cache configuration from Core::ConfigManager
         * @return UidCacheConfig structure, defaults when the module section is absent
         */
        core::Result< UidCacheConfig >          loadCacheConfig() noexcept;

        /**
         * @brief Validate configuration
         * @retval UidErrc::kInvalidArgument on unknown journal/synchronous mode or empty path
         */
        core::Result< void >                    validateConfig( const UidCacheConfig& config ) noexcept;

        /**
         * @brief Replace the configuration used for caches opened from now on
         */
        core::Result< void >                    updateConfig( const UidCacheConfig& config ) noexcept;

        UidCacheConfig                          getConfig() noexcept;

    protected:
        CUidCacheManager() noexcept = default;
        ~CUidCacheManager() noexcept;

        CUidCacheManager( const CUidCacheManager& ) = delete;
        CUidCacheManager& operator=( const CUidCacheManager& ) = delete;

    private:
        core::Result< void >                    ensureParentDirectory( core::StringView path ) noexcept;

    private:
        core::Bool                              m_bInitialized{ false };

        core::Mutex                             m_mtxCacheMap;
        _CacheMap                               m_cacheMap;

        core::Mutex                             m_mtxConfig;
        UidCacheConfig                          m_config;
    };
} // namespace uid
} // namespace lap

#endif
