#pragma once

#include <string_view>

namespace symcli {

enum class SymStatus {
    Ok = 0,
    UnknownFlag,
    MissingValue,
    InvalidValue,
    UnexpectedArgument,
    NoModeSpecified,
    ConflictingModes,
    EditRequiresFile,
    ConflictingInputs,
    NoKeySpecified,
    KeyFileNotFound,
    KeyFileUnreadable,
    KeychainUnavailable,
    KeychainMiss,
    InteractiveAborted,
    InvalidKey,
    WrongPassword,
    PasswordTooShort,
    PasswordMismatch,
    KeychainWriteFailed,
    FileIOError,
    CorruptCiphertext,
    AuthenticationFailed,
    EditorFailed,
    MissingRngBytes,
    UnknownOp,
    WriteFailed
};

enum class ErrorKind {
    None = 0,
    ParseError,
    CommandAmbiguous,
    KeyResolutionError,
    WriteError,
    ExecutionError
};

inline std::string_view ToString(const SymStatus status) {
    switch (status) {
        case SymStatus::Ok:
            return "Ok";
        case SymStatus::UnknownFlag:
            return "UnknownFlag";
        case SymStatus::MissingValue:
            return "MissingValue";
        case SymStatus::InvalidValue:
            return "InvalidValue";
        case SymStatus::UnexpectedArgument:
            return "UnexpectedArgument";
        case SymStatus::NoModeSpecified:
            return "NoModeSpecified";
        case SymStatus::ConflictingModes:
            return "ConflictingModes";
        case SymStatus::EditRequiresFile:
            return "EditRequiresFile";
        case SymStatus::ConflictingInputs:
            return "ConflictingInputs";
        case SymStatus::NoKeySpecified:
            return "NoKeySpecified";
        case SymStatus::KeyFileNotFound:
            return "KeyFileNotFound";
        case SymStatus::KeyFileUnreadable:
            return "KeyFileUnreadable";
        case SymStatus::KeychainUnavailable:
            return "KeychainUnavailable";
        case SymStatus::KeychainMiss:
            return "KeychainMiss";
        case SymStatus::InteractiveAborted:
            return "InteractiveAborted";
        case SymStatus::InvalidKey:
            return "InvalidKey";
        case SymStatus::WrongPassword:
            return "WrongPassword";
        case SymStatus::PasswordTooShort:
            return "PasswordTooShort";
        case SymStatus::PasswordMismatch:
            return "PasswordMismatch";
        case SymStatus::KeychainWriteFailed:
            return "KeychainWriteFailed";
        case SymStatus::FileIOError:
            return "FileIOError";
        case SymStatus::CorruptCiphertext:
            return "CorruptCiphertext";
        case SymStatus::AuthenticationFailed:
            return "AuthenticationFailed";
        case SymStatus::EditorFailed:
            return "EditorFailed";
        case SymStatus::MissingRngBytes:
            return "MissingRngBytes";
        case SymStatus::UnknownOp:
            return "UnknownOp";
        case SymStatus::WriteFailed:
            return "WriteFailed";
    }
    return "UnknownStatus";
}

inline std::string_view ToString(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::ParseError:
            return "ParseError";
        case ErrorKind::CommandAmbiguous:
            return "CommandAmbiguous";
        case ErrorKind::KeyResolutionError:
            return "KeyResolutionError";
        case ErrorKind::WriteError:
            return "WriteError";
        case ErrorKind::ExecutionError:
            return "ExecutionError";
    }
    return "UnknownKind";
}

inline ErrorKind KindOf(const SymStatus status) {
    switch (status) {
        case SymStatus::Ok:
            return ErrorKind::None;
        case SymStatus::UnknownFlag:
        case SymStatus::MissingValue:
        case SymStatus::InvalidValue:
        case SymStatus::UnexpectedArgument:
            return ErrorKind::ParseError;
        case SymStatus::NoModeSpecified:
        case SymStatus::ConflictingModes:
        case SymStatus::EditRequiresFile:
        case SymStatus::ConflictingInputs:
            return ErrorKind::CommandAmbiguous;
        case SymStatus::NoKeySpecified:
        case SymStatus::KeyFileNotFound:
        case SymStatus::KeyFileUnreadable:
        case SymStatus::KeychainUnavailable:
        case SymStatus::KeychainMiss:
        case SymStatus::InteractiveAborted:
        case SymStatus::InvalidKey:
        case SymStatus::WrongPassword:
            return ErrorKind::KeyResolutionError;
        case SymStatus::WriteFailed:
            return ErrorKind::WriteError;
        case SymStatus::PasswordTooShort:
        case SymStatus::PasswordMismatch:
        case SymStatus::KeychainWriteFailed:
        case SymStatus::FileIOError:
        case SymStatus::CorruptCiphertext:
        case SymStatus::AuthenticationFailed:
        case SymStatus::EditorFailed:
        case SymStatus::MissingRngBytes:
        case SymStatus::UnknownOp:
            return ErrorKind::ExecutionError;
    }
    return ErrorKind::ExecutionError;
}

// Process exit status for each error kind; 0 only for success.
inline int ExitCodeFor(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return 0;
        case ErrorKind::ExecutionError:
            return 1;
        case ErrorKind::ParseError:
            return 2;
        case ErrorKind::CommandAmbiguous:
            return 3;
        case ErrorKind::KeyResolutionError:
            return 4;
        case ErrorKind::WriteError:
            return 5;
    }
    return 1;
}

}  // namespace symcli
