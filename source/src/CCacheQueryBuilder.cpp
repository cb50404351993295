#include "CCacheQueryBuilder.hpp"

namespace lap
{
namespace uid
{
    // ==================== CacheQueryBuilder ====================

    core::String CacheQueryBuilder::BuildCreateTable()
    {
        return "CREATE TABLE IF NOT EXISTS " LAP_UID_TABLE_NAME " ("
               "  uuid CHAR(36) PRIMARY KEY NOT NULL,"
               "  name CHAR(32) NOT NULL)";
    }

    core::String CacheQueryBuilder::BuildCreateNameIndex()
    {
        return "CREATE INDEX " LAP_UID_NAME_INDEX " ON " LAP_UID_TABLE_NAME " (name)";
    }

    core::String CacheQueryBuilder::BuildUpsert()
    {
        return "INSERT OR REPLACE INTO " LAP_UID_TABLE_NAME " (name, uuid) VALUES (?, ?)";
    }

    core::String CacheQueryBuilder::BuildSelectIn( core::Size uCount )
    {
        core::String strSQL( "SELECT name, uuid FROM " LAP_UID_TABLE_NAME " WHERE uuid IN (" );
        strSQL.reserve( strSQL.size() + uCount * 3 + 1 );

        for ( core::Size i = 0; i < uCount; ++i ) {
            if ( i != 0 ) strSQL += ", ";
            strSQL += '?';
        }
        strSQL += ')';

        return strSQL;
    }

    core::String CacheQueryBuilder::BuildCount()
    {
        return "SELECT COUNT(*) FROM " LAP_UID_TABLE_NAME;
    }

    core::Vector< core::Size > CacheQueryBuilder::SplitBatch( core::Size uTotal, core::Size uLimit )
    {
        core::Vector< core::Size > chunks;

        if ( uTotal == 0 ) return chunks;

        if ( uLimit == 0 || uTotal <= uLimit ) {
            chunks.push_back( uTotal );
            return chunks;
        }

        chunks.reserve( ( uTotal + uLimit - 1 ) / uLimit );
        for ( core::Size uLeft = uTotal; uLeft > 0; ) {
            core::Size uChunk = uLeft < uLimit ? uLeft : uLimit;
            chunks.push_back( uChunk );
            uLeft -= uChunk;
        }

        return chunks;
    }

    core::Bool CacheQueryBuilder::IsIndexAlreadyExists( core::StringView strErrMsg ) noexcept
    {
        return strErrMsg.find( "already exists" ) != core::StringView::npos;
    }

    // ==================== CacheResultBuilder ====================

    CacheResultBuilder::CacheResultBuilder( core::Size uExpected )
    {
        m_mapResult.reserve( uExpected );
    }

    core::Result< void > CacheResultBuilder::AddRow( const core::Char* pName, core::Size uNameLen,
                                                     const core::Char* pUuid, core::Size uUuidLen ) noexcept
    {
        using result = core::Result< void >;

        if ( pName == nullptr || pUuid == nullptr ) {
            LAP_UID_LOG_ERROR << "NULL column in cache row";
            return result::FromError( MakeCacheError( CacheErrorCause::kCorruptedRow, 0 ) );
        }

        core::StringView strUuid( pUuid, uUuidLen );
        auto uuid = Uuid::FromString( strUuid );
        if ( !uuid.HasValue() ) {
            LAP_UID_LOG_ERROR << "Malformed uuid in cache row: " << strUuid;
            return result::FromError( MakeCacheError( CacheErrorCause::kCorruptedRow, 0 ) );
        }

        m_mapResult[ uuid.Value() ] = core::String( pName, uNameLen );
        ++m_uRows;

        return result::FromValue();
    }

    UuidNameMap CacheResultBuilder::Release() noexcept
    {
        m_uRows = 0;

        return ::std::move( m_mapResult );
    }
} // namespace uid
} // namespace lap
