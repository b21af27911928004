#pragma once

#include <cstdint>
#include <functional>

namespace Strata
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,
        NotFound,
        AlreadyExists,
        InvalidState,

        // Arenas
        OutOfMemory,
        InvalidCapacity,
        InvalidRelease,
        ArenaInUse,
        CorruptionDetected,
        SizeMismatch,

        // Entities and components
        StaleHandle,
        DuplicateComponent,
        MissingComponent,
        StorageLocked,
        CapacityExceeded,

        // Systems
        SystemConflict,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;
        // Address of the offending allocation, zero when not applicable
        std::uintptr_t address;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr, std::uintptr_t addr = 0) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c)), address(addr)
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator!=(const Error& other) const noexcept
        {
            return code != other.code;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::NotFound: return "Item not found";
                case ErrorCode::AlreadyExists: return "Item already exists";
                case ErrorCode::InvalidState: return "Invalid state";
                case ErrorCode::OutOfMemory: return "Out of memory";
                case ErrorCode::InvalidCapacity: return "Invalid arena capacity";
                case ErrorCode::InvalidRelease: return "Invalid release";
                case ErrorCode::ArenaInUse: return "Arena has live allocations";
                case ErrorCode::CorruptionDetected: return "Guard bytes corrupted";
                case ErrorCode::SizeMismatch: return "Request does not fit the slot";
                case ErrorCode::StaleHandle: return "Stale entity handle";
                case ErrorCode::DuplicateComponent: return "Component already present";
                case ErrorCode::MissingComponent: return "Component not present";
                case ErrorCode::StorageLocked: return "Storage locked by an active query";
                case ErrorCode::CapacityExceeded: return "Capacity exceeded";
                case ErrorCode::SystemConflict: return "System access conflicts with its group";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr, std::uintptr_t address = 0) noexcept
    {
        return Error(code, message, address);
    }

    inline const char* ToString(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::None: return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound: return "NotFound";
            case ErrorCode::AlreadyExists: return "AlreadyExists";
            case ErrorCode::InvalidState: return "InvalidState";
            case ErrorCode::OutOfMemory: return "OutOfMemory";
            case ErrorCode::InvalidCapacity: return "InvalidCapacity";
            case ErrorCode::InvalidRelease: return "InvalidRelease";
            case ErrorCode::ArenaInUse: return "ArenaInUse";
            case ErrorCode::CorruptionDetected: return "CorruptionDetected";
            case ErrorCode::SizeMismatch: return "SizeMismatch";
            case ErrorCode::StaleHandle: return "StaleHandle";
            case ErrorCode::DuplicateComponent: return "DuplicateComponent";
            case ErrorCode::MissingComponent: return "MissingComponent";
            case ErrorCode::StorageLocked: return "StorageLocked";
            case ErrorCode::CapacityExceeded: return "CapacityExceeded";
            case ErrorCode::SystemConflict: return "SystemConflict";
            default: return "Unknown";
        }
    }
}

namespace std
{
    template<>
    struct hash<Strata::Error>
    {
        std::size_t operator()(const Strata::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}
