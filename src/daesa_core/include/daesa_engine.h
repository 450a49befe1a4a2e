#pragma once
#include "daesa_builder.h"
#include "daesa_document.h"
#include "daesa_error.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Daesa {

// --- 실행 상태 ---
enum class StateType { AWAITING_TICK, AWAITING_CHOICE, DONE };

struct ExecutionState {
    StateType type = StateType::DONE;

    // AWAITING_TICK: 다음 tick에서 내보낼 노드
    NodeId node;
    // AWAITING_TICK: choose()로 확정된 선택지 노드인지 (확정된 선택지는 메뉴를 다시 열지 않는다)
    bool chosen = false;

    // AWAITING_CHOICE: 선택 가능한 노드들
    std::vector<NodeId> options;
    // AWAITING_CHOICE: true면 선택 즉시 선택지 블록으로 진입 (형제 CHOICE 묶음 메뉴)
    bool entersBody = false;

    static ExecutionState AwaitingTick(NodeId node, bool chosen = false) {
        ExecutionState s; s.type = StateType::AWAITING_TICK; s.node = node; s.chosen = chosen; return s;
    }
    static ExecutionState AwaitingChoice(std::vector<NodeId> options, bool entersBody) {
        ExecutionState s; s.type = StateType::AWAITING_CHOICE; s.options = std::move(options); s.entersBody = entersBody; return s;
    }
    static ExecutionState Done() { return ExecutionState(); }
};

// --- tick() 결과 ---
struct Tick {
    size_t number = 0;              // 단조 증가하는 스텝 번호 (1부터)
    std::vector<Command> commands;  // 비어 있으면 스크립트 종료

    bool empty() const { return commands.empty(); }
    size_t size() const { return commands.size(); }
    const Command& operator[](size_t i) const { return commands[i]; }
};

// --- Engine (상태 기계) ---
// 단일 스레드 전용. 동시에 여러 플레이를 돌리려면 인스턴스를 따로 만든다.
class Engine {
public:
    // 검증된 문서로 시작 (START 마커 노드, 없으면 첫 커맨드부터)
    bool start(Document document);
    bool start(StateTree stateTree);
    // 컴파일된 .dsb 버퍼로 시작
    bool start(const uint8_t* buffer, size_t size);

    // 현재 노드를 내보내고 다음 상태로 진행. AWAITING_CHOICE 중이면 실패.
    bool tick(Tick& out);
    // 대기 중인 선택지 중 하나를 고른다
    bool choose(int index);
    // 마커로 이동. 어떤 상태에서든 상태를 덮어쓴다.
    bool gotoMarker(const std::string& markerName);

    bool isFinished() const { return state_.type == StateType::DONE; }
    bool isAwaitingChoice() const { return state_.type == StateType::AWAITING_CHOICE; }
    std::vector<Command> getPendingChoices() const;
    const ExecutionState& getState() const { return state_; }
    size_t getStepCount() const { return stepCount_; }

    bool hasMarker(const std::string& markerName) const;
    std::vector<std::string> getMarkerNames() const;

    // 스크립트에 해당 이름의 커맨드가 있는지 (진단용 선형 탐색)
    bool usesCommand(const std::string& name) const;

    const StateTree& getStateTree() const { return stateTree_; }

    const Error& getError() const { return error_; }

private:
    StateTree stateTree_;
    ExecutionState state_;
    size_t stepCount_ = 0;
    Error error_;

    bool fail(ErrorKind kind, const std::string& message);
    bool isChoiceNode(NodeId id) const;

    // id를 내보낸 직후의 상태 계산
    void enterNode(NodeId id, bool chosen);
    // id(와 그 하위)를 끝낸 뒤 이어질 위치로 이동
    void leaveNode(NodeId id);
    // id부터 이어지는 형제 CHOICE 묶음
    std::vector<NodeId> choiceGroupFrom(NodeId id) const;
};

} // namespace Daesa
