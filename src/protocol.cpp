#include "protocol.hpp"

#include "errors.hpp"

namespace {

std::uint64_t header_u64(const json& j, const char* field) {
    if(!j.contains(field) || !j.at(field).is_number_unsigned()){
        throw PipelineError(std::string("stream header is missing '") + field + "'");
    }
    return j.at(field).get<std::uint64_t>();
}

bool starts_with(const std::string& line, const std::string& prefix){
    return line.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

json make_stream_header(const StreamHeader& header){
    json j;
    j["type"] = "stream_header";
    j["version"] = header.version;
    j["stages"] = stages_to_json(header.stages);
    j["offset"] = header.offset;
    j["length"] = header.length;
    j["block_size"] = header.block_size;
    return j;
}

StreamHeader parse_stream_header(const std::string& line){
    json j;
    try{
        j = json::parse(line);
    } catch(const json::exception& ex){
        throw PipelineError(std::string("stream header is not JSON: ") + ex.what());
    }
    if(!j.is_object() || j.value("type", "") != "stream_header"){
        throw PipelineError("expected a stream_header line");
    }
    StreamHeader header;
    if(!j.contains("version") || !j.at("version").is_number_integer()){
        throw PipelineError("stream header has no version");
    }
    header.version = j.at("version").get<int>();
    header.stages = stages_from_json(j.value("stages", json::array()));
    header.offset = header_u64(j, "offset");
    header.length = header_u64(j, "length");
    header.block_size = header_u64(j, "block_size");
    return header;
}

json make_stream_progress(std::uint64_t bytes_written){
    json j;
    j["type"] = "stream_progress";
    j["bytes_written"] = bytes_written;
    return j;
}

json make_stream_ack(std::uint64_t bytes_written){
    json j;
    j["type"] = "stream_ack";
    j["bytes_written"] = bytes_written;
    return j;
}

json make_stream_error(const std::string& message){
    json j;
    j["type"] = "stream_error";
    j["message"] = message;
    return j;
}

StreamReply parse_stream_reply(const std::string& line){
    json j;
    try{
        j = json::parse(line);
    } catch(const json::exception& ex){
        throw TransportError(std::string("unreadable reply from receiver: ") + ex.what());
    }
    if(!j.is_object()){
        throw TransportError("unexpected reply from receiver: " + line);
    }
    StreamReply reply;
    auto type = j.value("type", "");
    if(type == "stream_error"){
        reply.kind = StreamReply::Kind::Error;
        reply.message = j.value("message", std::string("unknown error"));
        return reply;
    }
    if(type == "stream_progress"){
        reply.kind = StreamReply::Kind::Progress;
    } else if(type == "stream_ack"){
        reply.kind = StreamReply::Kind::Ack;
    } else {
        throw TransportError("unexpected reply from receiver: " + line);
    }
    if(!j.contains("bytes_written") || !j.at("bytes_written").is_number_unsigned()){
        throw TransportError("receiver reply has no byte count: " + line);
    }
    reply.bytes_written = j.at("bytes_written").get<std::uint64_t>();
    return reply;
}

std::string make_ready_line(std::uint16_t port){
    return "READY " + std::to_string(port);
}

std::string make_done_line(std::uint64_t bytes){
    return "DONE " + std::to_string(bytes);
}

std::string make_error_line(const std::string& message){
    std::string flat = message;
    for(auto& c : flat){
        if(c == '\n' || c == '\r') c = ' ';
    }
    return "ERROR " + flat;
}

AgentLine parse_agent_line(const std::string& raw){
    std::string line = raw;
    while(!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    AgentLine parsed;
    if(starts_with(line, "READY ")){
        parsed.kind = AgentLine::Kind::Ready;
        parsed.payload = line.substr(6);
    } else if(starts_with(line, "DONE ")){
        parsed.kind = AgentLine::Kind::Done;
        parsed.payload = line.substr(5);
    } else if(starts_with(line, "ERROR")){
        parsed.kind = AgentLine::Kind::Error;
        parsed.payload = line.size() > 6 ? line.substr(6) : std::string();
    } else {
        parsed.kind = AgentLine::Kind::Value;
        parsed.payload = line;
    }
    return parsed;
}
