#include "IdentifierTranslator.hpp"

namespace doorsid

{

    namespace

    {

        // the largest object number representable as an absolute object key
        constexpr std::uint64_t MAX_ABS_NO = ObjectKey::WHOLE_CONTAINER_VALUE - 1;

        [[noreturn]] void fail(TranslationError error, const std::string &detail)
        {
            throw TranslationException(error) << "Unable to translate identifier (" << error << "): " << detail;
        }

        bool hintMatchesKind(TypeKind hint, UrnKind kind)
        {
            switch (kind) {
                case UrnKind::PROJECT_ROOT:
                    return hint == TypeKind::PROJECT_ROOT;
                case UrnKind::FOLDER:
                    return hint == TypeKind::FOLDER;
                case UrnKind::FORMAL_MODULE:
                    return hint == TypeKind::FORMAL_MODULE || hint == TypeKind::VIEW;
                case UrnKind::OBJECT:
                    return hint == TypeKind::OBJECT;
            }
            return false;
        }

    }

    std::optional<UrnKind> IdentifierTranslator::getUrnKind(TypeCode type_code)
    {
        switch (type_code.getKind()) {
            case TypeKind::PROJECT_ROOT:
                return UrnKind::PROJECT_ROOT;
            case TypeKind::FOLDER:
                return UrnKind::FOLDER;
            case TypeKind::FORMAL_MODULE:
            case TypeKind::VIEW:
                return UrnKind::FORMAL_MODULE;
            case TypeKind::OBJECT:
                return UrnKind::OBJECT;
            case TypeKind::BASELINE_SET:
            case TypeKind::UNKNOWN:
                break;
        }
        return std::nullopt;
    }

    UrnTranslation IdentifierTranslator::guidToUrn(const Guid &guid, UrnScheme scheme)
    {
        const auto &type_code = guid.getTypeCode();
        auto kind = getUrnKind(type_code);
        if (!kind) {
            fail(TranslationError::UNSUPPORTED_TYPE_CODE, "type code " + type_code.getName() + " of " + guid.toString());
        }
        
        auto parent_key = guid.getParent().getKey();
        const auto &object = guid.getObject();
        switch (type_code.getKind()) {
            case TypeKind::PROJECT_ROOT: {
                if (!object.isWholeContainer()) {
                    fail(TranslationError::INCONSISTENT_OBJECT_KEY, "project root with an object key: " + guid.toString());
                }
                return { Urn(scheme, guid.getDbId(), *kind, UrnId::simple(parent_key)), std::nullopt };
            }

            case TypeKind::OBJECT: {
                if (!object.isAbsolute()) {
                    fail(TranslationError::INCONSISTENT_OBJECT_KEY, "object without an absolute key: " + guid.toString());
                }
                auto id = UrnId::objectRef(object.getKey().getValue(), parent_key);
                return { Urn(scheme, guid.getDbId(), *kind, id), std::nullopt };
            }
            
            case TypeKind::VIEW: {
                if (!object.isAbsolute()) {
                    fail(TranslationError::INCONSISTENT_OBJECT_KEY, "view without a view key: " + guid.toString());
                }
                return { Urn(scheme, guid.getDbId(), *kind, UrnId::simple(parent_key)), object.getKey() };
            }

            default:
                return { Urn(scheme, guid.getDbId(), *kind, UrnId::simple(parent_key)), std::nullopt };
        }
    }
    
    Guid IdentifierTranslator::urnToGuid(const Urn &urn, std::optional<TypeCode> type_hint,
        std::optional<Key> view_key)
    {
        if (!type_hint) {
            fail(TranslationError::MISSING_TYPE_HINT, urn.toString());
        }
        auto hint = type_hint->getKind();
        if (!hintMatchesKind(hint, urn.getKind())) {
            fail(TranslationError::TYPE_HINT_MISMATCH, "type code " + type_hint->getName() 
                + " does not match " + urn.toString());
        }

        const auto &id = urn.getId();
        switch (hint) {
            case TypeKind::OBJECT: {
                if (id.getAbsNo() > MAX_ABS_NO) {
                    fail(TranslationError::INCONSISTENT_OBJECT_KEY, "object number out of range: " + urn.toString());
                }
                auto object = ObjectKey::absolute(Key(static_cast<std::uint32_t>(id.getAbsNo())));
                return Guid(urn.getDbId(), *type_hint, ParentKey(TypeKind::FORMAL_MODULE, id.getModuleKey()), object);
            }

            case TypeKind::VIEW: {
                if (!view_key) {
                    fail(TranslationError::MISSING_VIEW_KEY, urn.toString());
                }
                if (view_key->getValue() == ObjectKey::WHOLE_CONTAINER_VALUE) {
                    fail(TranslationError::INCONSISTENT_OBJECT_KEY, "invalid view key " + view_key->toString());
                }
                return Guid(urn.getDbId(), *type_hint, ParentKey(TypeKind::FORMAL_MODULE, id.getKey()),
                    ObjectKey::absolute(*view_key));
            }

            default:
                // project root, folder and module are their own containers
                return Guid(urn.getDbId(), *type_hint, ParentKey(*type_hint, id.getKey()), ObjectKey::wholeContainer());
        }
    }

}
