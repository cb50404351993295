/**
 * @file IUuidCache.cpp
 * @brief Implementation of IUuidCache single entry helpers and input checks
 * @version 0.1
 * @date 2025-12-02
 */

#include "IUuidCache.hpp"

namespace lap
{
namespace uid
{
    core::Result< void > IUuidCache::Put( const Uuid& uuid, core::StringView name ) noexcept
    {
        UuidNameMap entries;
        entries.emplace( uuid, core::String( name ) );

        return PutAll( entries );
    }

    core::Result< core::String > IUuidCache::GetIfPresent( const Uuid& uuid ) noexcept
    {
        using result = core::Result< core::String >;

        auto found = GetAllPresent( UuidList{ uuid } );
        if ( !found.HasValue() ) {
            return result::FromError( found.Error() );
        }

        auto it = found.Value().find( uuid );
        if ( it == found.Value().end() ) {
            return result::FromError( UidErrc::kKeyNotFound );
        }

        return result::FromValue( it->second );
    }

    core::Result< void > IUuidCache::checkIdentifiers( const UuidList& uuids ) noexcept
    {
        for ( const auto& uuid : uuids ) {
            if ( uuid.IsNil() ) {
                LAP_UID_LOG_ERROR << "Unexpected nil uuid in lookup request";
                return core::Result< void >::FromError( UidErrc::kInvalidArgument );
            }
        }

        return core::Result< void >::FromValue();
    }

    core::Result< void > IUuidCache::checkIdentifiers( const UuidNameMap& entries ) noexcept
    {
        for ( const auto& entry : entries ) {
            if ( entry.first.IsNil() ) {
                LAP_UID_LOG_ERROR << "Unexpected nil uuid in write request";
                return core::Result< void >::FromError( UidErrc::kInvalidArgument );
            }
        }

        return core::Result< void >::FromValue();
    }

} // namespace uid
} // namespace lap
