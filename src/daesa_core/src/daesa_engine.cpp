#include "daesa_engine.h"
#include <algorithm>
#include <iostream>

namespace Daesa {

// =================================================================
// 시작
// =================================================================
bool Engine::start(Document document) {
    return start(TreeBuilder::build(std::move(document)));
}

bool Engine::start(StateTree stateTree) {
    stateTree_ = std::move(stateTree);
    stepCount_ = 0;
    error_.clear();

    if (stateTree_.firstNode.isValid()) {
        state_ = ExecutionState::AwaitingTick(stateTree_.firstNode);
    } else {
        state_ = ExecutionState::Done();
    }
    return !isFinished();
}

bool Engine::start(const uint8_t* buffer, size_t size) {
    StateTree loaded;
    std::string error;
    if (!TreeBuilder::deserialize(buffer, size, loaded, error)) {
        std::cerr << "[Daesa] " << error << std::endl;
        stateTree_ = StateTree();
        state_ = ExecutionState::Done();
        return fail(ErrorKind::PARSE_FAILURE, error);
    }
    return start(std::move(loaded));
}

// =================================================================
// 헬퍼
// =================================================================
bool Engine::fail(ErrorKind kind, const std::string& message) {
    error_.kind = kind;
    error_.message = message;
    return false;
}

bool Engine::isChoiceNode(NodeId id) const {
    const Command* command = stateTree_.tree.getById(id);
    return command && command->isChoice();
}

std::vector<NodeId> Engine::choiceGroupFrom(NodeId id) const {
    std::vector<NodeId> group;
    for (NodeId cur = id; cur.isValid() && isChoiceNode(cur);
         cur = stateTree_.tree.nextSiblingOf(cur)) {
        group.push_back(cur);
    }
    return group;
}

void Engine::enterNode(NodeId id, bool chosen) {
    const auto& tree = stateTree_.tree;

    // 탐색 중 만난 CHOICE = 결정 지점. 연속된 형제 CHOICE들이 하나의 메뉴가 된다.
    if (isChoiceNode(id) && !chosen) {
        state_ = ExecutionState::AwaitingChoice(choiceGroupFrom(id), true);
        return;
    }

    const auto& children = tree.childrenOf(id);
    if (children.empty()) {
        leaveNode(id);
        return;
    }

    if (isChoiceNode(children.front())) {
        state_ = ExecutionState::AwaitingChoice(children, false);
    } else {
        // 분기 없는 중첩 블록은 순차적으로 내려간다
        state_ = ExecutionState::AwaitingTick(children.front());
    }
}

void Engine::leaveNode(NodeId id) {
    const auto& tree = stateTree_.tree;

    NodeId current = id;
    while (current.isValid()) {
        NodeId sibling = tree.nextSiblingOf(current);
        // 고른 선택지의 블록을 벗어나면 같은 묶음의 나머지 선택지는 건너뛴다
        if (isChoiceNode(current)) {
            while (sibling.isValid() && isChoiceNode(sibling)) {
                sibling = tree.nextSiblingOf(sibling);
            }
        }
        if (sibling.isValid()) {
            state_ = ExecutionState::AwaitingTick(sibling);
            return;
        }
        current = tree.parentOf(current);
    }

    state_ = ExecutionState::Done();
}

// =================================================================
// tick / choose / goto
// =================================================================
bool Engine::tick(Tick& out) {
    out.commands.clear();

    switch (state_.type) {
        case StateType::AWAITING_CHOICE:
            return fail(ErrorKind::ILLEGAL_STATE,
                        "a choice must be made before tick can be called again");

        case StateType::DONE:
            // 종료 후에는 빈 결과. 스텝 번호는 증가하지 않는다.
            out.number = stepCount_;
            return true;

        case StateType::AWAITING_TICK: {
            NodeId id = state_.node;
            const Command* command = stateTree_.tree.getById(id);
            if (!command) {
                state_ = ExecutionState::Done();
                return fail(ErrorKind::ILLEGAL_STATE, "no tree node for the current position");
            }

            out.number = ++stepCount_;
            out.commands.push_back(*command);
            enterNode(id, state_.chosen);
            return true;
        }
    }
    return false;
}

bool Engine::choose(int index) {
    switch (state_.type) {
        case StateType::AWAITING_TICK:
            return fail(ErrorKind::ILLEGAL_STATE, "a choice may not be made until one is presented");
        case StateType::DONE:
            return fail(ErrorKind::ILLEGAL_STATE, "a choice may not be made after the script has ended");
        case StateType::AWAITING_CHOICE:
            break;
    }

    if (index < 0 || index >= static_cast<int>(state_.options.size())) {
        return fail(ErrorKind::ILLEGAL_STATE,
                    "choice index " + std::to_string(index) + " is out of range (" +
                    std::to_string(state_.options.size()) + " options)");
    }

    NodeId selected = state_.options[static_cast<size_t>(index)];
    if (state_.entersBody) {
        // 메뉴로 이미 보여준 선택지 → 바로 블록 안으로
        enterNode(selected, true);
    } else {
        state_ = ExecutionState::AwaitingTick(selected, isChoiceNode(selected));
    }
    return true;
}

bool Engine::gotoMarker(const std::string& markerName) {
    auto it = stateTree_.markers.find(markerName);
    if (it == stateTree_.markers.end()) {
        return fail(ErrorKind::UNKNOWN_MARKER, "marker %" + markerName + "% does not exist");
    }

    if (it->second.isValid()) {
        state_ = ExecutionState::AwaitingTick(it->second);
    } else {
        // 뒤에 커맨드가 없는 마커 (%END%)
        state_ = ExecutionState::Done();
    }
    return true;
}

// =================================================================
// 조회
// =================================================================
std::vector<Command> Engine::getPendingChoices() const {
    std::vector<Command> choices;
    if (state_.type != StateType::AWAITING_CHOICE) return choices;

    for (NodeId id : state_.options) {
        const Command* command = stateTree_.tree.getById(id);
        if (command) choices.push_back(*command);
    }
    return choices;
}

bool Engine::hasMarker(const std::string& markerName) const {
    return stateTree_.markers.find(markerName) != stateTree_.markers.end();
}

std::vector<std::string> Engine::getMarkerNames() const {
    std::vector<std::string> names;
    names.reserve(stateTree_.markers.size());
    for (const auto& entry : stateTree_.markers) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Engine::usesCommand(const std::string& name) const {
    return stateTree_.tree.findBy([&name](const Command& c) { return c.name == name; }).first.isValid();
}

} // namespace Daesa
