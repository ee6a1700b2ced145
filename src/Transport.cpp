#include "Transport.hpp"
#include "FtdiTransport.hpp"
#include "SerialTransport.hpp"

std::unique_ptr<Transport> TransportFactory::createFtdiTransport(int device_index)
{
    return std::unique_ptr<Transport>(new FtdiTransport(device_index));
}

std::unique_ptr<Transport> TransportFactory::createSerialTransport(const std::string& device,
                                                                   uint32_t baud_rate)
{
    return std::unique_ptr<Transport>(new SerialTransport(device, baud_rate));
}
