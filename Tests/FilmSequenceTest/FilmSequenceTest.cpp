///////////////////////////////////////////////////////////////////////////////
// FILE:          FilmSequenceTest.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     Tests
//-----------------------------------------------------------------------------
// DESCRIPTION:   Runs one fixed-length film on the cameras of a configuration
//                file and prints what every camera answered.
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//
///////////////////////////////////////////////////////////////////////////////
#include <iostream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include "BusConfiguration.h"
#include "CameraController.h"
#include "DeviceAdapterRegistry.h"
#include "Error.h"
#include "MessageBus.h"
#include "DemoCamera.h"

#define TEST_VER					"1.0.0"
#define DEFAULT_FRAMES			100

/**
 * Module sending the film messages. Prints the responses to its messages.
 */
class FilmDriver : public cambus::Module
{
public:
	FilmDriver() : cambus::Module("film") {}

	void ProcessMessage(cambus::Message& msg) override
	{
		if(msg.GetKind() == cambus::MessageKind::InitialParameters)
			std::cout << "  initial parameters of " << msg.GetSource() << ": " << msg.GetData().GetParameters(cambus::field::Parameters).Dump() << std::endl;
	}

	void HandleResponses(cambus::Message& msg) override
	{
		for(const cambus::Response& resp : msg.GetResponses())
		{
			for(const std::string& name : resp.data.GetFieldNames())
			{
				const cambus::FieldValue& value = resp.data.Get(name);
				std::cout << "  " << resp.source << " -> " << name << ": ";
				if(value.GetType() == cambus::FieldValue::TypeParameters)
					std::cout << value.AsParameters().Dump();
				else if(value.GetType() == cambus::FieldValue::TypeFunctionality)
					std::cout << value.AsFunctionality()->ToJson().dump();
				else
					std::cout << "(" << cambus::TypeName(value.GetType()) << ")";
				std::cout << std::endl;
			}
		}
		for(const cambus::MessageError& err : msg.GetErrors())
			std::cout << "  ERROR " << err.source << " (" << err.code << "): " << err.text << std::endl;
	}

	/**
	 * Send a message and wait until every module has handled it
	 * @param bus Message bus
	 * @param type Message type
	 * @param data Message data
	 * @return The message, with responses and errors
	 */
	std::shared_ptr<cambus::Message> SendAndWait(cambus::MessageBus& bus, const std::string& type, const cambus::MessageData& data = cambus::MessageData())
	{
		std::cout << "Sending '" << type << "'" << std::endl;
		auto msg = std::make_shared<cambus::Message>(GetName(), type, data);
		bus.Send(msg);
		msg->WaitForCompletion();
		return msg;
	}
};

/**
 * Application entry point
 * @param argc Argument count
 * @param argv Argument list
 * @return Status code
 */
int main(int argc, char** argv)
{
	long frames = DEFAULT_FRAMES;

	// Parse input arguments
	if(argc < 2)
	{
		std::cout << "Invalid arguments specified. To see program options type FilmSequenceTest -help" << std::endl;
		return 2;
	}

	std::string carg(argv[1]);
	std::string lcarg(carg);
	std::transform(lcarg.begin(), lcarg.end(), lcarg.begin(), [](char c) { return (char)std::tolower(c); });
	if(lcarg == "-v")
	{
		std::cout << "FilmSequenceTest " << TEST_VER << std::endl;
		return 0;
	}
	else if(lcarg == "-help")
	{
		std::cout << "Runs a fixed-length film on the cameras of a configuration file." << std::endl << std::endl;
		std::cout << "FilmSequenceTest [config_file] [frames]" << std::endl << std::endl;
		std::cout << "Available device adapters: DemoCamera (device " << g_CameraDeviceName << ")" << std::endl;
		std::cout << "Default frame count is " << DEFAULT_FRAMES << std::endl;
		return 0;
	}
	std::string configfile = carg;

	// Obtain frame count
	if(argc > 2)
		try { frames = std::stol(argv[2]); } catch(std::exception& e) { std::cout << "Invalid argument value. " << e.what() << std::endl; return 1; }
	if(frames < 0)
	{
		std::cout << "Invalid frame count. To see program options type FilmSequenceTest -help" << std::endl;
		return 2;
	}

	std::cout << "Configuration " << configfile << std::endl;
	std::cout << "Frames " << frames << std::endl << std::endl;

	try
	{
		cambus::DeviceAdapterRegistry adapters;
		adapters.AddAdapter("DemoCamera", std::make_shared<DemoCameraAdapter>());

		cambus::BusConfiguration config = cambus::BusConfiguration::LoadFile(configfile);
		if(config.GetCameras().empty())
		{
			std::cout << "The configuration has no cameras" << std::endl;
			return 1;
		}

		// Slaves start before and stop after the master cameras
		std::vector<std::string> startorder;
		std::string master;
		for(const auto& cam : config.GetCameras())
			if(!cam.master)
				startorder.push_back(cam.name);
		for(const auto& cam : config.GetCameras())
		{
			if(cam.master)
			{
				startorder.push_back(cam.name);
				if(master.empty())
					master = cam.name;
			}
		}
		if(master.empty())
			master = config.GetCameras().front().name;

		cambus::MessageBus bus;
		cambus::ApplyConfiguration(config, bus, adapters);
		auto driver = std::make_shared<FilmDriver>();
		bus.AddModule(driver);
		bus.Start();

		driver->SendAndWait(bus, cambus::msgtype::ConfigureInitial);

		cambus::MessageData fdata;
		fdata.Set(cambus::field::Camera, master);
		auto fmsg = driver->SendAndWait(bus, cambus::msgtype::GetFunctionality, fdata);
		std::vector<cambus::Response> fresp = fmsg->GetResponses();
		if(fresp.empty())
		{
			std::cout << "Camera " << master << " did not report its functionality" << std::endl;
			bus.Shutdown();
			return 1;
		}
		auto functionality = fresp.front().data.GetFunctionality(cambus::field::Functionality);

		bool failed = false;
		cambus::MessageData sdata;
		sdata.Set(cambus::field::FilmSettings, camdev::FilmSettings::FixedLengthFilm(frames, "film"));
		failed |= driver->SendAndWait(bus, cambus::msgtype::StartFilm, sdata)->HasErrors();

		cambus::MessageData tdata;
		tdata.Set(cambus::field::Functionality, functionality);
		failed |= driver->SendAndWait(bus, cambus::msgtype::FilmTiming, tdata)->HasErrors();

		for(const std::string& name : startorder)
		{
			cambus::MessageData cdata;
			cdata.Set(cambus::field::Camera, name);
			failed |= driver->SendAndWait(bus, cambus::msgtype::StartCamera, cdata)->HasErrors();
		}
		for(auto it = startorder.rbegin(); it != startorder.rend(); ++it)
		{
			cambus::MessageData cdata;
			cdata.Set(cambus::field::Camera, *it);
			failed |= driver->SendAndWait(bus, cambus::msgtype::StopCamera, cdata)->HasErrors();
		}

		failed |= driver->SendAndWait(bus, cambus::msgtype::StopFilm)->HasErrors();

		bus.Shutdown();
		std::cout << std::endl << (failed ? "Film sequence completed with errors" : "Film sequence completed") << std::endl;
		return failed ? 1 : 0;
	}
	catch(const cambus::CamBusError& e)
	{
		std::cout << "Error: " << e.getFullMsg() << std::endl;
		return 1;
	}
}
