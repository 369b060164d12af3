#pragma once

namespace Estuary {

// Chat and conversations
inline constexpr int kKindConversation = 11;
inline constexpr int kKindConversationMetadata = 513;
inline constexpr int kKindThreadReply = 1111;

// Core records
inline constexpr int kKindTask = 1934;
inline constexpr int kKindProject = 31933;

// Agents
inline constexpr int kKindAgentLesson = 4129;
inline constexpr int kKindAgentProfile = 4199;

// Ephemeral status records (24xxx)
inline constexpr int kKindProjectStatus = 24010;
inline constexpr int kKindLlmConfigChange = 24020;
inline constexpr int kKindTypingStart = 24111;
inline constexpr int kKindTypingStop = 24112;
inline constexpr int kKindTaskAbort = 24133;

inline bool IsEphemeralKind(int kind) {
	return kind >= 20000 && kind < 30000;
}

inline bool IsAddressableKind(int kind) {
	return kind >= 30000 && kind < 40000;
}

}  // namespace Estuary
