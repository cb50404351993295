/**
 * @file IUuidCache.hpp
 * @brief Uuid cache interface - one contract for every backing store
 * @version 0.1
 * @date 2025-12-02
 *
 * @copyright Copyright (c) 2025
 *
 * Callers program against this interface only. The SQLite store and the
 * in-memory store implement it; nothing above it knows about SQL or files.
 */

#ifndef LAP_UIDCACHE_IUUIDCACHE_HPP
#define LAP_UIDCACHE_IUUIDCACHE_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace uid
{
    /**
     * @brief Abstract interface of a uuid -> name cache
     *
     * Thread Safety:
     * - All methods must be thread-safe
     *
     * Error Handling:
     * - All methods return core::Result<T>
     * - A nil uuid in any input fails with UidErrc::kInvalidArgument before any storage access.
     *   The nil value (00000000-0000-0000-0000-000000000000) stands for "no identifier", so the
     *   RFC 4122 nil UUID itself can never be stored or looked up.
     * - Storage failures are UidErrc::kCacheError, the cause is kept in the error support data
     * - No exceptions thrown
     */
    class IUuidCache
    {
    public:
        IMP_OPERATOR_NEW(IUuidCache)

        virtual ~IUuidCache() noexcept = default;

        /**
         * @brief Store every association, replacing the name of identifiers already cached
         *
         * @param entries uuid -> name associations
         * @return core::Result<void> Success or error code
         *
         * @note Entries are written one by one; on failure the entries before the
         *       failing one stay written (no cross-entry atomicity)
         */
        virtual core::Result< void >            PutAll( const UuidNameMap& entries ) noexcept = 0;

        /**
         * @brief Look up the subset of the given identifiers that are cached
         *
         * @param uuids identifiers to resolve, duplicates allowed
         * @return core::Result<UuidNameMap> found identifiers mapped to their names
         *
         * @note Unknown identifiers are omitted from the result, this is not an error
         * @note An empty input returns an empty map without touching storage
         */
        virtual core::Result< UuidNameMap >     GetAllPresent( const UuidList& uuids ) noexcept = 0;

        // ==================== Single entry helpers ====================

        core::Result< void >                    Put( const Uuid& uuid, core::StringView name ) noexcept;

        /**
         * @retval UidErrc::kKeyNotFound if the identifier is not cached
         */
        core::Result< core::String >            GetIfPresent( const Uuid& uuid ) noexcept;

    protected:
        IUuidCache() noexcept = default;

        IUuidCache( const IUuidCache& ) = delete;
        IUuidCache( IUuidCache&& ) = delete;
        IUuidCache& operator=( const IUuidCache& ) = delete;
        IUuidCache& operator=( IUuidCache&& ) = delete;

        // first nil identifier fails the whole request
        static core::Result< void >             checkIdentifiers( const UuidList& uuids ) noexcept;
        static core::Result< void >             checkIdentifiers( const UuidNameMap& entries ) noexcept;
    };

} // namespace uid
} // namespace lap

#endif // LAP_UIDCACHE_IUUIDCACHE_HPP
