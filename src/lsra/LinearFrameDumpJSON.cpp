#include "lsra/LinearFrameDumpJSON.hpp"

#include "lsra/LinearFrame.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cassert>

namespace lsra {

class LinearFrameDumpJSON::Impl {
public:
    ~Impl() = default;

    void dump(const LinearFrame* linearFrame, const std::vector<std::string>& registerNames, bool prettyPrint) {
        m_registerNames = &registerNames;
        m_doc.SetObject();
        m_buffer.Clear();
        encodeFrame(linearFrame);

        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        assert(result);
        m_registerNames = nullptr;
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;
    const std::vector<std::string>* m_registerNames = nullptr;

    void encodeFrame(const LinearFrame* linearFrame) {
        auto& alloc = m_doc.GetAllocator();

        rapidjson::Value blockOrder;
        blockOrder.SetArray();
        for (auto blockId : linearFrame->blockOrder) {
            blockOrder.PushBack(blockId, alloc);
        }
        m_doc.AddMember("blockOrder", blockOrder, alloc);

        rapidjson::Value blocks;
        blocks.SetArray();
        for (auto blockId : linearFrame->blockOrder) {
            rapidjson::Value block;
            block.SetObject();
            block.AddMember("id", rapidjson::Value(blockId), alloc);
            block.AddMember("from", rapidjson::Value(linearFrame->blockRanges[blockId].from), alloc);
            block.AddMember("to", rapidjson::Value(linearFrame->blockRanges[blockId].to), alloc);
            block.AddMember("loopDepth", rapidjson::Value(linearFrame->loopDepths[blockId]), alloc);
            if (linearFrame->loopEnds[blockId] != kInvalidPosition) {
                block.AddMember("loopEnd", rapidjson::Value(linearFrame->loopEnds[blockId]), alloc);
            }
            rapidjson::Value liveIns;
            liveIns.SetArray();
            if (static_cast<size_t>(blockId) < linearFrame->liveIns.size()) {
                for (auto vReg : linearFrame->liveIns[blockId]) {
                    liveIns.PushBack(vReg, alloc);
                }
            }
            block.AddMember("liveIns", liveIns, alloc);
            blocks.PushBack(block, alloc);
        }
        m_doc.AddMember("blocks", blocks, alloc);

        rapidjson::Value loopEdges;
        loopEdges.SetArray();
        for (const auto& edge : linearFrame->loopEdges) {
            rapidjson::Value loopEdge;
            loopEdge.SetObject();
            loopEdge.AddMember("from", rapidjson::Value(edge.first), alloc);
            loopEdge.AddMember("to", rapidjson::Value(edge.second), alloc);
            loopEdges.PushBack(loopEdge, alloc);
        }
        m_doc.AddMember("loopEdges", loopEdges, alloc);

        m_doc.AddMember("numberOfPositions", rapidjson::Value(linearFrame->numberOfPositions()), alloc);
        m_doc.AddMember("numberOfSpillSlots", rapidjson::Value(linearFrame->numberOfSpillSlots), alloc);
        m_doc.AddMember("numberOfSpilledIntervals", rapidjson::Value(linearFrame->numberOfSpilledIntervals), alloc);

        rapidjson::Value values;
        values.SetArray();
        for (size_t i = 0; i < linearFrame->valueLifetimes.size(); ++i) {
            rapidjson::Value value;
            value.SetObject();
            value.AddMember("value", rapidjson::Value(static_cast<int32_t>(i)), alloc);
            rapidjson::Value intervals;
            intervals.SetArray();
            for (const auto& lifetime : linearFrame->valueLifetimes[i]) {
                if (lifetime.isEmpty()) {
                    continue;
                }
                rapidjson::Value interval;
                encodeInterval(lifetime, interval);
                intervals.PushBack(interval, alloc);
            }
            value.AddMember("intervals", intervals, alloc);
            values.PushBack(value, alloc);
        }
        m_doc.AddMember("values", values, alloc);

        rapidjson::Value edgeResolutions;
        edgeResolutions.SetArray();
        for (const auto& resolution : linearFrame->edgeResolutions) {
            rapidjson::Value edge;
            edge.SetObject();
            edge.AddMember("from", rapidjson::Value(resolution.from), alloc);
            edge.AddMember("to", rapidjson::Value(resolution.to), alloc);
            switch (resolution.placement) {
            case EdgeResolution::Placement::kPredecessorExit:
                edge.AddMember("placement", rapidjson::Value("predecessorExit"), alloc);
                break;
            case EdgeResolution::Placement::kSuccessorEntry:
                edge.AddMember("placement", rapidjson::Value("successorEntry"), alloc);
                break;
            case EdgeResolution::Placement::kCriticalEdge:
                edge.AddMember("placement", rapidjson::Value("criticalEdge"), alloc);
                break;
            }
            rapidjson::Value moves;
            encodeMoves(resolution.moves, moves);
            edge.AddMember("moves", moves, alloc);
            edgeResolutions.PushBack(edge, alloc);
        }
        m_doc.AddMember("edgeResolutions", edgeResolutions, alloc);

        rapidjson::Value splitMoves;
        splitMoves.SetArray();
        for (const auto& split : linearFrame->splitMoves) {
            rapidjson::Value position;
            position.SetObject();
            position.AddMember("position", rapidjson::Value(split.first), alloc);
            rapidjson::Value moves;
            encodeMoves(split.second, moves);
            position.AddMember("moves", moves, alloc);
            splitMoves.PushBack(position, alloc);
        }
        m_doc.AddMember("splitMoves", splitMoves, alloc);
    }

    void encodeInterval(const LifetimeInterval& lifetime, rapidjson::Value& interval) {
        auto& alloc = m_doc.GetAllocator();
        interval.SetObject();

        rapidjson::Value ranges;
        ranges.SetArray();
        for (const auto& range : lifetime.ranges) {
            rapidjson::Value pair;
            pair.SetArray();
            pair.PushBack(range.from, alloc);
            pair.PushBack(range.to, alloc);
            ranges.PushBack(pair, alloc);
        }
        interval.AddMember("ranges", ranges, alloc);

        rapidjson::Value usages;
        usages.SetArray();
        for (const auto& usage : lifetime.usages) {
            rapidjson::Value use;
            use.SetObject();
            use.AddMember("position", rapidjson::Value(usage.first), alloc);
            use.AddMember("requiresRegister", rapidjson::Value(usage.second == UseKind::kRegister), alloc);
            usages.PushBack(use, alloc);
        }
        interval.AddMember("usages", usages, alloc);

        rapidjson::Value location;
        encodeLocation(lifetime.location(), location);
        interval.AddMember("location", location, alloc);
        interval.AddMember("isSplit", rapidjson::Value(lifetime.isSplit), alloc);
    }

    void encodeMoves(const std::vector<Move>& moves, rapidjson::Value& value) {
        auto& alloc = m_doc.GetAllocator();
        value.SetArray();
        for (const auto& move : moves) {
            rapidjson::Value encoded;
            encoded.SetObject();
            rapidjson::Value from, to;
            encodeLocation(move.from, from);
            encodeLocation(move.to, to);
            encoded.AddMember("from", from, alloc);
            encoded.AddMember("to", to, alloc);
            encoded.AddMember("value", rapidjson::Value(move.vReg), alloc);
            value.PushBack(encoded, alloc);
        }
    }

    void encodeLocation(const Location& location, rapidjson::Value& value) {
        auto& alloc = m_doc.GetAllocator();
        if (location.isRegister() && location.number >= 0
                && static_cast<size_t>(location.number) < m_registerNames->size()) {
            value.SetString((*m_registerNames)[location.number].c_str(), alloc);
        } else {
            value.SetString(location.toString().c_str(), alloc);
        }
    }
};

LinearFrameDumpJSON::LinearFrameDumpJSON(): m_impl(std::make_unique<LinearFrameDumpJSON::Impl>()) { }

LinearFrameDumpJSON::~LinearFrameDumpJSON() { }

void LinearFrameDumpJSON::dump(const LinearFrame* linearFrame, const std::vector<std::string>& registerNames,
        bool prettyPrint) {
    m_impl->dump(linearFrame, registerNames, prettyPrint);
}

std::string_view LinearFrameDumpJSON::json() const { return m_impl->json(); }

} // namespace lsra
