/**
 * @file CUuidMemoryCache.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief In-process uuid cache, nothing is persisted
 * @version 0.1
 * @date 2025-12-04
 *
 *
 */
#ifndef LAP_UIDCACHE_UUIDMEMORYCACHE_HPP
#define LAP_UIDCACHE_UUIDMEMORYCACHE_HPP

#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "IUuidCache.hpp"

namespace lap
{
namespace uid
{
    class UuidMemoryCache final : public IUuidCache
    {
    public:
        IMP_OPERATOR_NEW(UuidMemoryCache)

    public:
        UuidMemoryCache() noexcept = default;
        ~UuidMemoryCache() noexcept = default;

        core::Result< void >                    PutAll( const UuidNameMap& entries ) noexcept override;
        core::Result< UuidNameMap >             GetAllPresent( const UuidList& uuids ) noexcept override;

        core::Size                              GetEntryCount() const noexcept;

    private:
        UuidNameMap                             m_mapEntries;
        mutable core::Mutex                     m_mutex;
    };
} // namespace uid
} // namespace lap

#endif
