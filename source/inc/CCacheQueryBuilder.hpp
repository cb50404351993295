/**
 * @file CCacheQueryBuilder.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief SQL text of the uuid cache and folding of result rows
 * @version 0.1
 * @date 2025-12-03
 *
 *
 */
#ifndef LAP_UIDCACHE_CACHEQUERYBUILDER_HPP
#define LAP_UIDCACHE_CACHEQUERYBUILDER_HPP

#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace uid
{
    class CacheQueryBuilder final
    {
    public:
        static core::String                     BuildCreateTable();

        // plain CREATE INDEX, fails with "already exists" on every open after the first
        static core::String                     BuildCreateNameIndex();

        static core::String                     BuildUpsert();

        /**
         * @brief SELECT with a membership predicate of uCount bound parameters
         *
         * "SELECT name, uuid FROM uuid_cache WHERE uuid IN (?, ?, ...)"
         *
         * @param uCount number of placeholders, must be > 0
         */
        static core::String                     BuildSelectIn( core::Size uCount );

        static core::String                     BuildCount();

        /**
         * @brief Split a request of uTotal identifiers into chunk sizes not above uLimit
         *
         * @return chunk sizes, empty when uTotal is 0; one chunk when uLimit is 0
         */
        static core::Vector< core::Size >       SplitBatch( core::Size uTotal, core::Size uLimit );

        // index creation errors that mean the index is already there
        static core::Bool                       IsIndexAlreadyExists( core::StringView strErrMsg ) noexcept;

    private:
        CacheQueryBuilder() = delete;
    };

    /**
     * @brief Folds (name, uuid) rows into a uuid -> name map
     *
     * The map is detached from storage once Release() hands it out.
     */
    class CacheResultBuilder final
    {
    public:
        CacheResultBuilder() = default;
        explicit CacheResultBuilder( core::Size uExpected );

        /**
         * @brief Add one row
         *
         * Columns are taken as pointer plus byte count, so names with embedded
         * NUL characters come back whole. A nullptr column is SQL NULL.
         *
         * @return UidErrc::kCacheError with CacheErrorCause::kCorruptedRow when the
         *         stored uuid text is not canonical or a column is NULL
         */
        core::Result< void >                    AddRow( const core::Char* pName, core::Size uNameLen,
                                                        const core::Char* pUuid, core::Size uUuidLen ) noexcept;

        core::Size                              RowCount() const noexcept       { return m_uRows; }
        UuidNameMap                             Release() noexcept;

    private:
        UuidNameMap                             m_mapResult;
        core::Size                              m_uRows{ 0 };
    };
} // namespace uid
} // namespace lap

#endif
