#pragma once

#include <optional>
#include "Guid.hpp"
#include "Urn.hpp"
#include "Exceptions.hpp"

namespace doorsid

{

    struct UrnTranslation
    {
        Urn m_urn;
        // set only when translating a View GUID (the URN names the owning module)
        std::optional<Key> m_view_key;
    };

    /**
     * GUID <-> URN translation
     * 
     * GUID -> URN is lossy: the baseline is dropped (URNs have no baseline),
     * pass Guid::getBaseline() to the UrlBuilder where needed.
     * 
     * URN -> GUID is under-determined: the caller must provide the GUID type code,
     * the result never carries a baseline (working copy).
    */
    class IdentifierTranslator
    {
    public:
        /**
         * ProjectRoot -> P, Folder -> F, FormalModule -> M, Object -> O,
         * View -> M of the module in the parent field + view key from the object field
         * @throw TranslationException
        */
        static UrnTranslation guidToUrn(const Guid &, UrnScheme = UrnScheme::RATIONAL);

        /**
         * @param type_hint GUID type code, must match the URN kind (View requires an M URN)
         * @param view_key required for the View type hint
         * @throw TranslationException
        */
        static Guid urnToGuid(const Urn &, std::optional<TypeCode> type_hint, 
            std::optional<Key> view_key = std::nullopt);

        // the URN kind a GUID type code translates to (nullopt if not translatable)
        static std::optional<UrnKind> getUrnKind(TypeCode);
    };

}
