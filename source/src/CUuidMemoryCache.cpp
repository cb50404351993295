#include "CUuidMemoryCache.hpp"

namespace lap
{
namespace uid
{
    core::Result< void > UuidMemoryCache::PutAll( const UuidNameMap& entries ) noexcept
    {
        auto checkResult = checkIdentifiers( entries );
        if ( !checkResult.HasValue() ) {
            return checkResult;
        }

        core::LockGuard lock( m_mutex );

        for ( const auto& entry : entries ) {
            m_mapEntries[ entry.first ] = entry.second;
        }

        return core::Result< void >::FromValue();
    }

    core::Result< UuidNameMap > UuidMemoryCache::GetAllPresent( const UuidList& uuids ) noexcept
    {
        using result = core::Result< UuidNameMap >;

        auto checkResult = checkIdentifiers( uuids );
        if ( !checkResult.HasValue() ) {
            return result::FromError( checkResult.Error() );
        }

        UuidNameMap found;
        if ( uuids.empty() ) return result::FromValue( ::std::move( found ) );

        core::LockGuard lock( m_mutex );

        for ( const auto& uuid : uuids ) {
            auto it = m_mapEntries.find( uuid );
            if ( it != m_mapEntries.end() ) {
                found.emplace( it->first, it->second );
            }
        }

        return result::FromValue( ::std::move( found ) );
    }

    core::Size UuidMemoryCache::GetEntryCount() const noexcept
    {
        core::LockGuard lock( m_mutex );

        return m_mapEntries.size();
    }
} // namespace uid
} // namespace lap
