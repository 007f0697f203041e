/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "codec.hpp"

#include "osc/OscOutboundPacketStream.h"
#include "osc/OscReceivedElements.h"

#include <array>
#include <cstring>

namespace vrb {

//------------------- osc_message ---------------------//

bool operator==(const osc_message& a, const osc_message& b) {
    return a.address == b.address && a.arguments == b.arguments;
}

namespace {

struct argument_printer {
    std::ostream& os;

    void operator()(const osc_nil&) { os << "N"; }
    void operator()(bool b) { os << (b ? "T" : "F"); }
    void operator()(int32_t i) { os << i; }
    void operator()(int64_t h) { os << h << "h"; }
    void operator()(float f) { os << f << "f"; }
    void operator()(double d) { os << d << "d"; }
    void operator()(const std::string& s) { os << "\"" << s << "\""; }
    void operator()(const osc_blob& b) { os << "<blob " << b.size() << ">"; }
};

} // namespace

std::ostream& operator<<(std::ostream& os, const osc_message& msg) {
    os << msg.address;
    for (auto& arg : msg.arguments) {
        os << " ";
        std::visit(argument_printer{os}, arg);
    }
    return os;
}

//------------------- encode ---------------------//

namespace {

struct argument_writer {
    osc::OutboundPacketStream& msg;

    void operator()(const osc_nil&) { msg << osc::OscNil; }
    void operator()(bool b) { msg << b; }
    void operator()(int32_t i) { msg << (osc::int32)i; }
    void operator()(int64_t h) { msg << (osc::int64)h; }
    void operator()(float f) { msg << f; }
    void operator()(double d) { msg << d; }
    void operator()(const std::string& s) { msg << s.c_str(); }
    void operator()(const osc_blob& b) {
        msg << osc::Blob(b.data(), (osc::osc_bundle_element_size_t)b.size());
    }
};

} // namespace

std::vector<VrbByte> osc_encode(const std::string& address,
                                const std::vector<osc_argument>& args) {
    std::array<char, VRB_MAX_PACKET_SIZE> buffer;
    try {
        osc::OutboundPacketStream msg(buffer.data(), buffer.size());
        msg << osc::BeginMessage(address.c_str());
        for (auto& arg : args) {
            std::visit(argument_writer{msg}, arg);
        }
        msg << osc::EndMessage;

        auto data = (const VrbByte *)msg.Data();
        return std::vector<VrbByte>(data, data + msg.Size());
    } catch (const osc::Exception& e) {
        throw osc_error(std::string("could not encode OSC message: ") + e.what());
    }
}

//------------------- decode ---------------------//

bool osc_is_bundle(const VrbByte *data, VrbSize size) {
    return size > 0 && data[0] == '#';
}

namespace {

osc_message read_message(const osc::ReceivedMessage& msg) {
    osc_message result;
    result.address = msg.AddressPattern();
    result.arguments.reserve(msg.ArgumentCount());

    for (auto it = msg.ArgumentsBegin(); it != msg.ArgumentsEnd(); ++it) {
        switch (it->TypeTag()) {
        case osc::NIL_TYPE_TAG:
            result.arguments.emplace_back(osc_nil{});
            break;
        case osc::TRUE_TYPE_TAG:
            result.arguments.emplace_back(true);
            break;
        case osc::FALSE_TYPE_TAG:
            result.arguments.emplace_back(false);
            break;
        case osc::INT32_TYPE_TAG:
            result.arguments.emplace_back((int32_t)it->AsInt32Unchecked());
            break;
        case osc::INT64_TYPE_TAG:
            result.arguments.emplace_back((int64_t)it->AsInt64Unchecked());
            break;
        case osc::FLOAT_TYPE_TAG:
            result.arguments.emplace_back(it->AsFloatUnchecked());
            break;
        case osc::DOUBLE_TYPE_TAG:
            result.arguments.emplace_back(it->AsDoubleUnchecked());
            break;
        case osc::STRING_TYPE_TAG:
            result.arguments.emplace_back(std::string(it->AsStringUnchecked()));
            break;
        case osc::SYMBOL_TYPE_TAG:
            result.arguments.emplace_back(std::string(it->AsSymbolUnchecked()));
            break;
        case osc::BLOB_TYPE_TAG:
        {
            const void *blob;
            osc::osc_bundle_element_size_t blobsize;
            it->AsBlobUnchecked(blob, blobsize);
            auto bytes = (const VrbByte *)blob;
            result.arguments.emplace_back(osc_blob(bytes, bytes + blobsize));
            break;
        }
        default:
            throw osc_error(std::string("unsupported OSC type tag '")
                            + it->TypeTag() + "'");
        }
    }

    return result;
}

void read_bundle(const osc::ReceivedBundle& bundle, std::vector<osc_message>& result) {
    for (auto it = bundle.ElementsBegin(); it != bundle.ElementsEnd(); ++it) {
        if (it->IsBundle()) {
            read_bundle(osc::ReceivedBundle(*it), result);
        } else {
            result.push_back(read_message(osc::ReceivedMessage(*it)));
        }
    }
}

} // namespace

osc_message osc_decode(const VrbByte *data, VrbSize size) {
    if (size == 0) {
        throw osc_error("malformed OSC packet: empty packet");
    }
    if (osc_is_bundle(data, size)) {
        throw osc_error("malformed OSC packet: expected message, got bundle");
    }
    try {
        osc::ReceivedPacket packet((const char *)data,
                                   (osc::osc_bundle_element_size_t)size);
        return read_message(osc::ReceivedMessage(packet));
    } catch (const osc::Exception& e) {
        throw osc_error(std::string("malformed OSC packet: ") + e.what());
    }
}

std::vector<osc_message> osc_decode_bundle(const VrbByte *data, VrbSize size) {
    if (!osc_is_bundle(data, size)) {
        throw osc_error("malformed OSC packet: expected bundle");
    }
    try {
        std::vector<osc_message> result;
        osc::ReceivedPacket packet((const char *)data,
                                   (osc::osc_bundle_element_size_t)size);
        read_bundle(osc::ReceivedBundle(packet), result);
        return result;
    } catch (const osc::Exception& e) {
        throw osc_error(std::string("malformed OSC bundle: ") + e.what());
    }
}

} // vrb
